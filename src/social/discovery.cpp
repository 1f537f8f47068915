#include "src/social/discovery.h"

#include "lansocial/framing.hpp"
#include "lansocial/util.hpp"

#include <algorithm>
#include <utility>

namespace social {

using boost::asio::ip::address_v4;

DiscoveryBroadcaster::DiscoveryBroadcaster(boost::asio::io_context& io,
                                           EventQueue& events,
                                           SelfInfoFn self,
                                           TargetsFn targets)
    : events_(events),
      self_(std::move(self)),
      targets_fn_(std::move(targets)),
      socket_(io),
      timer_(io) {}

bool DiscoveryBroadcaster::start() {
  boost::system::error_code ec;
  socket_.open(udp::v4(), ec);
  if (ec) {
    lansocial::log("failed to open broadcast socket: " + ec.message());
    events_.push(Event::status("LAN autodiscovery unavailable: " + ec.message()));
    return false;
  }
  socket_.set_option(boost::asio::socket_base::broadcast(true), ec);
  if (ec) lansocial::log("SO_BROADCAST rejected: " + ec.message());

  running_ = true;
  tick_ = 0;
  events_.push(Event::status("LAN autodiscovery active on UDP " + std::to_string(self_().discovery_port)));
  schedule_tick(std::chrono::steady_clock::duration::zero());
  return true;
}

void DiscoveryBroadcaster::stop() {
  running_ = false;
  timer_.cancel();
  boost::system::error_code ignored;
  socket_.close(ignored);
}

std::vector<PacketType> DiscoveryBroadcaster::packets_for_tick(uint64_t tick) {
  if (tick % kProbeEveryTicks == 0) return {PacketType::Probe, PacketType::Announce};
  return {PacketType::Announce};
}

std::vector<DiscoveryBroadcaster::udp::endpoint> DiscoveryBroadcaster::discovery_targets(
    uint16_t port,
    const std::vector<address_v4>& broadcasts) {
  std::vector<udp::endpoint> out;
  out.emplace_back(address_v4::broadcast(), port);
  for (const auto& b : broadcasts) {
    udp::endpoint ep(b, port);
    if (std::find(out.begin(), out.end(), ep) == out.end()) out.push_back(ep);
  }
  return out;
}

void DiscoveryBroadcaster::schedule_tick(std::chrono::steady_clock::duration delay) {
  timer_.expires_after(delay);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || !running_) return;
    tick();
    schedule_tick(kAnnounceInterval);
  });
}

void DiscoveryBroadcaster::tick() {
  if (tick_ % kTargetRefreshTicks == 0 || targets_.empty()) targets_ = targets_fn_();

  const SelfInfo self = self_();
  for (PacketType type : packets_for_tick(tick_)) {
    const std::string raw = lansocial::dump_compact(make_discovery_packet(type, self));
    for (const auto& target : targets_) {
      boost::system::error_code ignored;
      socket_.send_to(boost::asio::buffer(raw), target, 0, ignored);
    }
  }
  ++tick_;
}

DiscoveryListener::DiscoveryListener(boost::asio::io_context& io,
                                     PeerTable& table,
                                     EventQueue& events,
                                     SelfInfoFn self)
    : table_(table),
      events_(events),
      self_(std::move(self)),
      socket_(io) {}

bool DiscoveryListener::start() {
  const uint16_t port = self_().discovery_port;
  boost::system::error_code ec;
  socket_.open(udp::v4(), ec);
  if (!ec) socket_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (!ec) socket_.bind(udp::endpoint(address_v4::any(), port), ec);
  if (ec) {
    lansocial::log("failed to bind discovery socket on UDP " + std::to_string(port) + ": " + ec.message());
    events_.push(Event::status("Cannot bind UDP discovery port " + std::to_string(port)));
    boost::system::error_code ignored;
    socket_.close(ignored);
    return false;
  }
  lansocial::log("discovery listening on 0.0.0.0:" + std::to_string(bound_port()));
  do_receive();
  return true;
}

void DiscoveryListener::stop() {
  boost::system::error_code ignored;
  socket_.close(ignored);
}

void DiscoveryListener::set_local_addresses(std::vector<address_v4> addresses) {
  local_addresses_ = std::move(addresses);
}

bool DiscoveryListener::is_self_address(const boost::asio::ip::address& a) const {
  if (a.is_loopback()) return true;
  if (a.is_v6() && a.to_v6().is_v4_mapped()) {
    return is_self_address(boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, a.to_v6()));
  }
  if (!a.is_v4()) return false;
  const auto v4 = a.to_v4();
  return std::find(local_addresses_.begin(), local_addresses_.end(), v4) != local_addresses_.end();
}

uint16_t DiscoveryListener::bound_port() const {
  boost::system::error_code ec;
  const auto ep = socket_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

DiscoveryListener::Disposition DiscoveryListener::handle_datagram(std::string_view bytes, const udp::endpoint& from) {
  if (is_self_address(from.address())) return Disposition::DroppedSelf;

  const auto pkt = parse_discovery_packet(bytes);
  if (!pkt) return Disposition::DroppedMalformed;

  const SelfInfo self = self_();
  if (pkt->node_id == self.node_id) return Disposition::DroppedSelf;

  const std::string host = from.address().to_string();
  const bool usable_port = pkt->chat_port > 0 && pkt->chat_port <= 65535;

  Peer peer;
  peer.name = pkt->name.empty() ? host : pkt->name;
  peer.host = host;
  peer.port = usable_port ? static_cast<uint16_t>(pkt->chat_port) : 0;
  peer.source = PeerSource::Lan;
  peer.node_id = pkt->node_id;

  if (pkt->type == "probe") {
    // Replies always go to the shared discovery port, not the sender's source port.
    const std::string reply = lansocial::dump_compact(make_discovery_packet(PacketType::Announce, self));
    send_reply(reply, udp::endpoint(from.address(), self.discovery_port));
    if (!usable_port) return Disposition::Ignored;
    upsert_and_notify(table_, events_, peer);
    return Disposition::Seen;
  }

  if (pkt->type != "announce" || !usable_port) return Disposition::Ignored;
  upsert_and_notify(table_, events_, peer);
  return Disposition::Seen;
}

void DiscoveryListener::send_reply(const std::string& bytes, const udp::endpoint& to) {
  if (reply_sender_) {
    reply_sender_(bytes, to);
    return;
  }
  boost::system::error_code ignored;
  socket_.send_to(boost::asio::buffer(bytes), to, 0, ignored);
}

void DiscoveryListener::do_receive() {
  socket_.async_receive_from(boost::asio::buffer(rxbuf_), remote_,
                             [this](const boost::system::error_code& ec, std::size_t n) {
    if (ec) {
      if (ec == boost::asio::error::operation_aborted || !socket_.is_open()) return;
      lansocial::log(std::string("discovery recv error: ") + ec.message());
      do_receive();
      return;
    }
    handle_datagram(std::string_view(rxbuf_.data(), n), remote_);
    do_receive();
  });
}

} // namespace social
