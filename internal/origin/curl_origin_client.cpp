#include "internal/origin/curl_origin_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mediacache::origin {

namespace {

std::once_flag g_curl_global_init;

struct TransferState {
  const OriginClient::ResponseHandler* on_response = nullptr;
  const OriginClient::DataHandler*     on_data     = nullptr;
  CURL*                                curl        = nullptr;
  const std::atomic<bool>*             shutdown    = nullptr;

  OriginResponse response;
  bool           head_delivered = false;
  bool           discard_body   = false;
  bool           stopped        = false;
};

class CurlHandle {
 public:
  CurlHandle() : handle_(curl_easy_init()) {
    if (!handle_) throw util::NetworkError("curl_easy_init failed");
  }
  ~CurlHandle() {
    curl_easy_cleanup(handle_);
  }

  CurlHandle(const CurlHandle&)            = delete;
  CurlHandle& operator=(const CurlHandle&) = delete;

  CURL* get() const {
    return handle_;
  }

 private:
  CURL* handle_;
};

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto*            state = static_cast<TransferState*>(userdata);
  const size_t     total = size * nitems;
  std::string_view line(buffer, total);

  // every response in a redirect chain starts over
  if (line.starts_with("HTTP/")) {
    state->response = OriginResponse{};
    return total;
  }

  const auto colon = line.find(':');
  if (colon == std::string_view::npos) return total;

  const auto name  = Trim(line.substr(0, colon));
  const auto value = Trim(line.substr(colon + 1));

  if (EqualsIgnoreCase(name, "Content-Length")) {
    uint64_t parsed = 0;
    auto [ptr, ec]  = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec == std::errc() && ptr == value.data() + value.size()) state->response.content_length = parsed;
  } else if (EqualsIgnoreCase(name, "Content-Range")) {
    state->response.content_range = ParseContentRange(value);
  } else if (EqualsIgnoreCase(name, "Accept-Ranges")) {
    state->response.accepts_ranges = EqualsIgnoreCase(value, "bytes");
  }
  return total;
}

void DeliverHead(TransferState& state) {
  if (state.head_delivered) return;
  state.head_delivered = true;

  long status = 0;
  curl_easy_getinfo(state.curl, CURLINFO_RESPONSE_CODE, &status);
  state.response.status = status;

  if (status < 200 || status >= 300) {
    state.discard_body = true;
    return;
  }
  if (state.on_response && !(*state.on_response)(state.response)) {
    state.stopped = true;
  }
}

size_t WriteCallback(char* data, size_t size, size_t nmemb, void* userdata) {
  auto*        state = static_cast<TransferState*>(userdata);
  const size_t total = size * nmemb;

  DeliverHead(*state);
  if (state->stopped) return 0;
  if (state->discard_body) return total;

  if (state->on_data && !(*state->on_data)(reinterpret_cast<const uint8_t*>(data), total)) {
    state->stopped = true;
    return 0;
  }
  return total;
}

int ProgressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto* state = static_cast<TransferState*>(userdata);
  return state->shutdown->load() ? 1 : 0;
}

void ConfigureCommon(CURL* curl, TransferState& state, const CurlOriginOptions& options, const std::string& url, bool bounded,
                     char* errbuf) {
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
  // byte offsets must refer to the stored representation
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "identity");
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout.count()));
  if (bounded) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.transfer_timeout.count()));
  }
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.stall_timeout.count()));

  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
}

void CheckOutcome(TransferState& state, CURLcode rc, const char* errbuf, const std::string& url) {
  if (rc != CURLE_OK) {
    std::string detail = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
    throw util::NetworkError("fetch " + url + ": " + detail);
  }

  const long status = state.response.status;
  if (status >= 500 || status == 408 || status == 429) {
    throw util::NetworkError("origin returned HTTP " + std::to_string(status) + " for " + url);
  }
  if (status < 200 || status >= 300) {
    throw util::OriginError("origin returned HTTP " + std::to_string(status) + " for " + url, status);
  }
}

} // namespace

CurlOriginClient::CurlOriginClient(CurlOriginOptions options) : options_(std::move(options)) {
  std::call_once(g_curl_global_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

void CurlOriginClient::Shutdown() {
  shutdown_ = true;
}

OriginResponse CurlOriginClient::Fetch(const FetchRequest& request, const ResponseHandler& on_response, const DataHandler& on_data) {
  if (shutdown_) throw util::NetworkError("origin client is shut down");

  CurlHandle    curl;
  TransferState state;
  state.on_response = &on_response;
  state.on_data     = &on_data;
  state.curl        = curl.get();
  state.shutdown    = &shutdown_;

  char errbuf[CURL_ERROR_SIZE] = {0};
  ConfigureCommon(curl.get(), state, options_, request.url, !request.unbounded_duration, errbuf);

  std::string range;
  if (request.range) {
    range = std::to_string(request.range->first) + "-" + std::to_string(request.range->last);
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
  }

  const CURLcode rc = curl_easy_perform(curl.get());
  if (state.stopped) return state.response;

  // empty bodies never reach the write callback
  if (rc == CURLE_OK) DeliverHead(state);
  if (state.stopped) return state.response;

  CheckOutcome(state, rc, errbuf, request.url);
  return state.response;
}

OriginResponse CurlOriginClient::Head(const std::string& url) {
  if (shutdown_) throw util::NetworkError("origin client is shut down");

  CurlHandle    curl;
  TransferState state;
  state.curl     = curl.get();
  state.shutdown = &shutdown_;

  char errbuf[CURL_ERROR_SIZE] = {0};
  ConfigureCommon(curl.get(), state, options_, url, true, errbuf);
  curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc == CURLE_OK) DeliverHead(state);
  CheckOutcome(state, rc, errbuf, url);
  return state.response;
}

ProbeResult CurlOriginClient::Probe(const std::string& url) {
  ProbeResult result;

  try {
    auto head             = Head(url);
    result.accepts_ranges = head.accepts_ranges;
    if (head.content_length && *head.content_length > 0) {
      result.total_size = head.content_length;
      return result;
    }
  } catch (const util::OriginError& e) {
    MEDIACACHE_LOG_DEBUG("HEAD rejected by origin, probing with ranged GET", {observability::StringField("error", e.what())});
  }

  FetchRequest request;
  request.url   = url;
  request.range = ByteRange{0, 0};

  // the head carries everything needed; stop before the body
  auto response = Fetch(
      request, [](const OriginResponse&) { return false; }, [](const uint8_t*, std::size_t) { return false; });

  if (response.status == 206) {
    result.accepts_ranges = true;
    if (response.content_range) result.total_size = response.content_range->total;
  } else if (response.status == 200) {
    result.accepts_ranges = false;
    result.total_size     = response.content_length;
  }
  return result;
}

} // namespace mediacache::origin
