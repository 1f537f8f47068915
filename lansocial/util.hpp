#pragma once

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace lansocial {

inline std::string iso_timestamp_utc() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t t = system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  char buf[32];
  std::snprintf(buf,
                sizeof(buf),
                "%04d-%02d-%02dT%02d:%02d:%02dZ",
                tm.tm_year + 1900,
                tm.tm_mon + 1,
                tm.tm_mday,
                tm.tm_hour,
                tm.tm_min,
                tm.tm_sec);
  return buf;
}

// Local wall clock as HH:MM:SS, for chat transcripts.
inline std::string local_clock_hms() {
  using namespace std::chrono;
  const std::time_t t = system_clock::to_time_t(system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

inline double unix_time_seconds() {
  using namespace std::chrono;
  return duration<double>(system_clock::now().time_since_epoch()).count();
}

inline void log(std::string_view msg) {
  std::cerr << "[" << iso_timestamp_utc() << "] " << msg << "\n";
}

inline std::string_view trim(std::string_view v) {
  while (!v.empty() && std::isspace(static_cast<unsigned char>(v.front()))) v.remove_prefix(1);
  while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back()))) v.remove_suffix(1);
  return v;
}

inline std::string to_lower(std::string_view v) {
  std::string out(v);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

inline bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Whole-string decimal port in [1, 65535].
inline std::optional<uint16_t> parse_port(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  unsigned long value = 0;
  const auto* first = s.data();
  const auto* last = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) return std::nullopt;
  if (value == 0 || value > 65535) return std::nullopt;
  return static_cast<uint16_t>(value);
}

struct HostPort {
  std::string host;
  uint16_t port = 0;
};

inline std::optional<HostPort> parse_host_port(std::string_view s) {
  // Supports "host:port" and "[ipv6]:port".
  s = trim(s);
  if (s.empty()) return std::nullopt;

  std::string_view host;
  std::string_view port_str;

  if (s.front() == '[') {
    const auto rb = s.find(']');
    if (rb == std::string_view::npos) return std::nullopt;
    host = s.substr(1, rb - 1);
    if (rb + 1 >= s.size() || s[rb + 1] != ':') return std::nullopt;
    port_str = s.substr(rb + 2);
  } else {
    const auto colon = s.rfind(':');
    if (colon == std::string_view::npos) return std::nullopt;
    host = s.substr(0, colon);
    port_str = s.substr(colon + 1);
  }

  host = trim(host);
  if (host.empty()) return std::nullopt;
  const auto port = parse_port(port_str);
  if (!port) return std::nullopt;

  return HostPort{std::string(host), *port};
}

inline std::string host_port_key(std::string_view host, uint16_t port) {
  return std::string(host) + ":" + std::to_string(port);
}

} // namespace lansocial
