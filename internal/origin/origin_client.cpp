#include "internal/origin/origin_client.hpp"

#include <charconv>

namespace mediacache::origin {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.remove_suffix(1);
  return s;
}

bool ParseU64(std::string_view s, uint64_t& out) {
  if (s.empty()) return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

} // namespace

std::optional<ContentRange> ParseContentRange(std::string_view value) {
  value = Trim(value);
  constexpr std::string_view kUnit = "bytes ";
  if (value.substr(0, kUnit.size()) != kUnit) return std::nullopt;
  value.remove_prefix(kUnit.size());

  const auto dash  = value.find('-');
  const auto slash = value.find('/');
  if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) return std::nullopt;

  ContentRange range;
  if (!ParseU64(Trim(value.substr(0, dash)), range.first)) return std::nullopt;
  if (!ParseU64(Trim(value.substr(dash + 1, slash - dash - 1)), range.last)) return std::nullopt;
  if (range.last < range.first) return std::nullopt;

  const auto total = Trim(value.substr(slash + 1));
  if (total != "*") {
    uint64_t parsed = 0;
    if (!ParseU64(total, parsed)) return std::nullopt;
    range.total = parsed;
  }
  return range;
}

} // namespace mediacache::origin
