#pragma once

#include "lansocial/framing.hpp"
#include "src/social/event_queue.h"
#include "src/social/peer_table.h"
#include "src/social/wire.h"

#include <utility>  // needed before Boost 1.74 asio (std::exchange in awaitable.hpp)
#include <boost/asio.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace social {

using SelfInfoFn = std::function<SelfInfo()>;

constexpr auto kAnnounceInterval = std::chrono::milliseconds(2500);
constexpr uint64_t kTargetRefreshTicks = 8;
constexpr uint64_t kProbeEveryTicks = 2;

// Sends announce (and every other tick a probe first) to the global broadcast
// address and every local subnet broadcast. Per-target send errors are ignored.
class DiscoveryBroadcaster {
 public:
  using udp = boost::asio::ip::udp;
  using TargetsFn = std::function<std::vector<udp::endpoint>()>;

  DiscoveryBroadcaster(boost::asio::io_context& io, EventQueue& events, SelfInfoFn self, TargetsFn targets);

  bool start();
  void stop();

  static std::vector<PacketType> packets_for_tick(uint64_t tick);
  // 255.255.255.255 first, then each subnet broadcast once.
  static std::vector<udp::endpoint> discovery_targets(uint16_t port,
                                                      const std::vector<boost::asio::ip::address_v4>& broadcasts);

  uint64_t ticks() const { return tick_; }

 private:
  void schedule_tick(std::chrono::steady_clock::duration delay);
  void tick();

  EventQueue& events_;
  SelfInfoFn self_;
  TargetsFn targets_fn_;

  udp::socket socket_;
  boost::asio::steady_timer timer_;
  std::vector<udp::endpoint> targets_;
  uint64_t tick_ = 0;
  bool running_ = false;
};

// Receives discovery datagrams on the shared discovery port and turns them into
// PeerTable updates. Probes are answered with a unicast announce.
class DiscoveryListener {
 public:
  using udp = boost::asio::ip::udp;
  using ReplySender = std::function<void(const std::string& bytes, const udp::endpoint& to)>;

  enum class Disposition { DroppedSelf, DroppedMalformed, Ignored, Seen };

  DiscoveryListener(boost::asio::io_context& io, PeerTable& table, EventQueue& events, SelfInfoFn self);

  // Binds the discovery port. On failure a status event is pushed and receiving stays off.
  bool start();
  void stop();

  // Must be called from the thread that runs the io_context.
  void set_local_addresses(std::vector<boost::asio::ip::address_v4> addresses);
  void set_reply_sender(ReplySender sender) { reply_sender_ = std::move(sender); }

  bool is_self_address(const boost::asio::ip::address& a) const;
  Disposition handle_datagram(std::string_view bytes, const udp::endpoint& from);

  uint16_t bound_port() const;

 private:
  void do_receive();
  void send_reply(const std::string& bytes, const udp::endpoint& to);

  PeerTable& table_;
  EventQueue& events_;
  SelfInfoFn self_;

  udp::socket socket_;
  udp::endpoint remote_;
  std::array<char, lansocial::kMaxDatagramSize> rxbuf_{};
  std::vector<boost::asio::ip::address_v4> local_addresses_;
  ReplySender reply_sender_;
};

} // namespace social
