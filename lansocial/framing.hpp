#pragma once

#include "lansocial/json.hpp"
#include "lansocial/util.hpp"

#include <charconv>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lansocial {

// Discovery datagrams are a single JSON object each.
static constexpr std::size_t kMaxDatagramSize = 4096;
// Chat connections carry newline-delimited JSON, read to EOF.
static constexpr std::size_t kMaxChatPayload = 64 * 1024;

// Invalid UTF-8 in user text is replaced instead of throwing.
inline std::string dump_compact(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

inline std::string frame_json_line(const json& j) {
  std::string out = dump_compact(j);
  out.push_back('\n');
  return out;
}

// Parses one JSON object; anything else (arrays, scalars, garbage) is rejected.
inline std::optional<json> parse_json_object(std::string_view text) {
  json j = json::parse(text.begin(), text.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;
  return j;
}

// Splits a stream payload into its non-blank, trimmed lines.
inline std::vector<std::string_view> split_json_lines(std::string_view payload) {
  std::vector<std::string_view> out;
  while (!payload.empty()) {
    const auto nl = payload.find('\n');
    std::string_view line = payload.substr(0, nl);
    payload = (nl == std::string_view::npos) ? std::string_view{} : payload.substr(nl + 1);
    line = trim(line);
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

inline std::string json_string_or(const json& j, const char* key, std::string fallback = {}) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return fallback;
  if (it->is_string()) {
    std::string s = it->get<std::string>();
    return s.empty() ? fallback : s;
  }
  if (it->is_number() || it->is_boolean()) return dump_compact(*it);
  return fallback;
}

constexpr double kMaxExactJsonInteger = 9007199254740992.0; // 2^53

// Integer fields are accepted as JSON numbers or numeric strings; anything else reads as 0.
inline long long json_int_or_zero(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) return 0;
  if (it->is_number_integer()) return it->get<long long>();
  if (it->is_number_float()) {
    // Only integral doubles inside the exactly-representable range convert.
    const double d = it->get<double>();
    if (!std::isfinite(d) || std::fabs(d) > kMaxExactJsonInteger || d != std::trunc(d)) return 0;
    return static_cast<long long>(d);
  }
  if (it->is_string()) {
    const std::string s(trim(it->get<std::string>()));
    if (s.empty()) return 0;
    long long v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return 0;
    return v;
  }
  return 0;
}

} // namespace lansocial
