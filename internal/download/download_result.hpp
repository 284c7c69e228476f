#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace mediacache::download {

enum class DownloadError {
  kNone = 0,

  kNotFound,    // entry missing or chunk index past the end
  kNetwork,     // retries exhausted
  kOrigin,      // non-retryable origin status
  kStorage,     // disk write failure
  kUnknownSize, // origin never reported a length
  kCancelled,   // shutdown
  kInternal
};

/*
  Outcome of one chunk download. The downloader reports failures
  through this value and never throws.
*/
struct DownloadResult {
  DownloadError code = DownloadError::kNone;
  std::string   message;
  uint64_t      bytes_fetched = 0;

  static DownloadResult Ok(uint64_t bytes = 0) {
    return {DownloadError::kNone, {}, bytes};
  }

  static DownloadResult Err(DownloadError c, std::string msg) {
    return {c, std::move(msg), 0};
  }

  explicit operator bool() const {
    return code == DownloadError::kNone;
  }
};

std::string_view ToString(DownloadError code);

} // namespace mediacache::download
