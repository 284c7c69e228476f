#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mediacache::proxy {

// Inclusive byte span as used on the wire.
struct ByteSpan {
  uint64_t first = 0;
  uint64_t last  = 0;

  uint64_t Length() const {
    return last - first + 1;
  }
};

/*
  Single-range "bytes=" parsing against a known total size (> 0).

    bytes=a-b   b clamped to total-1
    bytes=a-
    bytes=-n    last n bytes

  Returns nullopt for malformed, unsatisfiable or multi-range values.
*/
std::optional<ByteSpan> ParseRangeHeader(std::string_view value, uint64_t total);

// Span to serve: the parsed range, or the whole resource when absent or invalid.
ByteSpan ResolveRange(std::optional<std::string_view> header, uint64_t total);

// "bytes first-last/total"
std::string ContentRangeValue(const ByteSpan& span, uint64_t total);

} // namespace mediacache::proxy
