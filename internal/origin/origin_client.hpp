#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mediacache::origin {

// Parsed "Content-Range: bytes first-last/total" (total may be "*").
struct ContentRange {
  uint64_t                first = 0;
  uint64_t                last  = 0;
  std::optional<uint64_t> total;
};

std::optional<ContentRange> ParseContentRange(std::string_view value);

struct OriginResponse {
  long                        status = 0;
  std::optional<uint64_t>     content_length;
  std::optional<ContentRange> content_range;
  bool                        accepts_ranges = false;
};

struct ByteRange {
  uint64_t first = 0;
  uint64_t last  = 0; // inclusive, as on the wire
};

struct FetchRequest {
  std::string              url;
  std::optional<ByteRange> range;
  // Whole-file transfers rely on the stall timeout only.
  bool unbounded_duration = false;
};

struct ProbeResult {
  std::optional<uint64_t> total_size;
  bool                    accepts_ranges = false;
};

/*
  OriginClient

  HTTP access to the upstream media resource.

  Fetch() calls on_response once with the final response head before any
  body bytes, then on_data for every received block. Either handler may
  return false to stop the transfer; Fetch() then returns normally.

  Errors:
    util::NetworkError  transport failure, timeout or 5xx (retryable)
    util::OriginError   any other non-2xx status
*/
class OriginClient {
 public:
  using ResponseHandler = std::function<bool(const OriginResponse&)>;
  using DataHandler     = std::function<bool(const uint8_t* data, std::size_t size)>;

  virtual ~OriginClient() = default;

  virtual OriginResponse Fetch(const FetchRequest& request, const ResponseHandler& on_response, const DataHandler& on_data) = 0;

  // Resolves the total size, HEAD first then a one-byte ranged GET.
  virtual ProbeResult Probe(const std::string& url) = 0;

  // Aborts running transfers; later calls fail with NetworkError.
  virtual void Shutdown() = 0;
};

} // namespace mediacache::origin
