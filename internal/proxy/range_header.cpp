#include "internal/proxy/range_header.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace mediacache::proxy {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::optional<uint64_t> ParseNumber(std::string_view s) {
  s = Trim(s);
  if (s.empty()) return std::nullopt;

  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return value;
}

} // namespace

std::optional<ByteSpan> ParseRangeHeader(std::string_view value, uint64_t total) {
  if (total == 0) return std::nullopt;

  value = Trim(value);
  constexpr std::string_view kUnit = "bytes=";
  if (value.size() < kUnit.size()) return std::nullopt;
  for (size_t i = 0; i < kUnit.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(value[i])) != kUnit[i]) return std::nullopt;
  }
  value.remove_prefix(kUnit.size());

  if (value.find(',') != std::string_view::npos) return std::nullopt;

  const auto dash = value.find('-');
  if (dash == std::string_view::npos) return std::nullopt;

  const auto first_text = Trim(value.substr(0, dash));
  const auto last_text  = Trim(value.substr(dash + 1));

  if (first_text.empty()) {
    auto suffix = ParseNumber(last_text);
    if (!suffix || *suffix == 0) return std::nullopt;
    const uint64_t length = std::min(*suffix, total);
    return ByteSpan{total - length, total - 1};
  }

  auto first = ParseNumber(first_text);
  if (!first || *first >= total) return std::nullopt;

  if (last_text.empty()) return ByteSpan{*first, total - 1};

  auto last = ParseNumber(last_text);
  if (!last || *last < *first) return std::nullopt;
  return ByteSpan{*first, std::min(*last, total - 1)};
}

ByteSpan ResolveRange(std::optional<std::string_view> header, uint64_t total) {
  if (header) {
    if (auto span = ParseRangeHeader(*header, total)) return *span;
  }
  return ByteSpan{0, total - 1};
}

std::string ContentRangeValue(const ByteSpan& span, uint64_t total) {
  return "bytes " + std::to_string(span.first) + "-" + std::to_string(span.last) + "/" + std::to_string(total);
}

} // namespace mediacache::proxy
