#pragma once

#include <openssl/rand.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <utility>

namespace lansocial {

// Per-process node id: 12 lowercase hex characters, never persisted.
class NodeIdentity {
 public:
  static constexpr std::size_t kIdBytes = 6;

  NodeIdentity() : id_(generate()) {}
  explicit NodeIdentity(std::string fixed_id) : id_(std::move(fixed_id)) {}

  std::string_view id() const { return id_; }

 private:
  static std::string generate() {
    std::array<uint8_t, kIdBytes> buf{};
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
      // Uniqueness on a LAN is all that matters here.
      std::random_device rd;
      for (auto& b : buf) b = static_cast<uint8_t>(rd());
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(buf.size() * 2);
    for (uint8_t b : buf) {
      out.push_back(kHex[b >> 4]);
      out.push_back(kHex[b & 0x0F]);
    }
    return out;
  }

  std::string id_;
};

} // namespace lansocial
