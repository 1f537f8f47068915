#pragma once

#include "lansocial/peer.hpp"
#include "src/social/event_queue.h"
#include "src/social/peer_table.h"
#include "src/social/wire.h"

#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace social {

constexpr auto kGcInterval = std::chrono::seconds(2);
constexpr auto kStaleTimeout = std::chrono::seconds(10);

struct EngineOptions {
  std::string nickname = "Player1";
  uint16_t discovery_port = 38655;
  uint16_t chat_base = 38600;
  uint16_t chat_span = 24;
  std::filesystem::path peers_file; // empty: manual peers live in memory only
  std::chrono::steady_clock::duration send_timeout = std::chrono::seconds(4);
};

struct DeliveryResult {
  bool ok = false;
  std::string host;
  uint16_t port = 0;
  std::string key;
  bool via_fallback = false; // delivered somewhere other than the selected endpoint
  std::size_t attempts = 0;
  boost::system::error_code last_error;
};

// What the caller should select after a delivery attempt: nothing on failure
// (keep the old selection), otherwise the entry that actually took the message.
std::optional<Peer> selection_after_delivery(const Peer& target, const DeliveryResult& r, const PeerTable& table);

// Discovery, chat transport and peer bookkeeping for one node. Workers run on a
// private network thread between start() and stop(); send_chat/deliver block the
// calling thread for at most the send timeout per attempt.
class SocialEngine {
 public:
  explicit SocialEngine(EngineOptions opt);
  ~SocialEngine();

  SocialEngine(const SocialEngine&) = delete;
  SocialEngine& operator=(const SocialEngine&) = delete;

  // Binding failures degrade the affected subsystem and are reported as status events.
  void start();
  void stop();
  bool running() const;

  boost::system::error_code send_chat(const std::string& host, uint16_t port, std::string_view text);
  DeliveryResult deliver(const Peer& selected, std::string_view text);

  EventQueue& events();
  PeerTable& peer_table();
  std::vector<Peer> peers() const;

  std::optional<Peer> add_manual_peer(std::string_view text);
  bool remove_manual_peer(const std::string& key);

  // "ip:chat_port" for every local IPv4 address; what other users enter as a manual peer.
  std::vector<std::string> local_endpoints() const;
  bool chat_enabled() const;
  uint16_t chat_port() const;
  std::string_view node_id() const;
  SelfInfo self_info() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace social
