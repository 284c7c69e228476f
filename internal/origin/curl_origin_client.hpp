#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "internal/origin/origin_client.hpp"

namespace mediacache::origin {

struct CurlOriginOptions {
  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds transfer_timeout{300000};
  // A transfer below 1 byte/s for this long is treated as a network error.
  std::chrono::seconds stall_timeout{30};
  std::string          user_agent{"mediacache/0.1"};
};

/*
  libcurl implementation of OriginClient.
  One easy handle per call; safe to use from any number of threads.
*/
class CurlOriginClient final : public OriginClient {
 public:
  explicit CurlOriginClient(CurlOriginOptions options = {});

  OriginResponse Fetch(const FetchRequest& request, const ResponseHandler& on_response, const DataHandler& on_data) override;

  ProbeResult Probe(const std::string& url) override;

  void Shutdown() override;

 private:
  OriginResponse Head(const std::string& url);

  CurlOriginOptions options_;
  std::atomic<bool> shutdown_{false};
};

} // namespace mediacache::origin
