#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace mediacache::runtime::config {
class RuntimeConfig;
}

namespace mediacache::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"mediacache"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint64_t export_interval_ms{1000};
};

bool InitializeMetrics(const mediacache::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  void RecordProxyRequest(std::string_view route, int http_status);
  void ObserveProxyLatencyMs(std::string_view route, double latency_ms);
  void ObserveDownloadDurationMs(std::string_view outcome, double duration_ms);
  void SetQueueDepth(std::uint64_t pending, std::uint64_t in_flight);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const mediacache::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordProxyRequest(std::string_view, int) {
}

inline void Metrics::ObserveProxyLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveDownloadDurationMs(std::string_view, double) {
}

inline void Metrics::SetQueueDepth(std::uint64_t, std::uint64_t) {
}
#endif

} // namespace mediacache::observability
