#include "src/social/social_engine.h"

#include "lansocial/identity.hpp"
#include "lansocial/netif.hpp"
#include "lansocial/peer_store.hpp"
#include "lansocial/util.hpp"
#include "src/social/candidates.h"
#include "src/social/chat_transport.h"
#include "src/social/discovery.h"
#include "src/social/port_allocator.h"

#include <utility>  // needed before Boost 1.74 asio (std::exchange in awaitable.hpp)
#include <boost/asio.hpp>

#include <atomic>
#include <future>
#include <mutex>
#include <thread>
#include <utility>

namespace social {

struct SocialEngine::Impl {
  explicit Impl(EngineOptions o)
      : opt(std::move(o)),
        listener(io, table, events, [this] { return self_info(); }),
        broadcaster(io, events, [this] { return self_info(); }, [this] { return refresh_targets(); }),
        chat(io, table, events),
        gc_timer(io) {}

  SelfInfo self_info() const {
    SelfInfo s;
    s.node_id = std::string(identity.id());
    s.name = opt.nickname;
    s.chat_port = chat_port.load();
    s.discovery_port = opt.discovery_port;
    return s;
  }

  // Runs on the network thread; interface changes are picked up here.
  std::vector<boost::asio::ip::udp::endpoint> refresh_targets() {
    listener.set_local_addresses(lansocial::netif::local_ipv4_addresses());
    return DiscoveryBroadcaster::discovery_targets(opt.discovery_port, lansocial::netif::local_ipv4_broadcasts());
  }

  void schedule_gc() {
    gc_timer.expires_after(kGcInterval);
    gc_timer.async_wait([this](const boost::system::error_code& ec) {
      if (ec) return;
      for (auto& key : table.collect_stale(PeerTable::Clock::now(), kStaleTimeout)) {
        lansocial::log("peer " + key + " timed out");
        events.push(Event::peer_down(std::move(key)));
      }
      schedule_gc();
    });
  }

  void load_manual_peers() {
    if (opt.peers_file.empty()) return;
    std::vector<Peer> stored;
    std::string err;
    if (!lansocial::peer_store::load_manual_peers(opt.peers_file, &stored, &err)) {
      lansocial::log(err);
      events.push(Event::status("Cannot load manual peers: " + err));
      return;
    }
    for (const auto& p : stored) upsert_and_notify(table, events, p);
    lansocial::log("loaded " + std::to_string(stored.size()) + " manual peer(s) from " + opt.peers_file.string());
  }

  void persist_manual_peers() {
    if (opt.peers_file.empty()) return;
    std::lock_guard lk(persist_m);
    std::string err;
    if (!lansocial::peer_store::save_manual_peers(opt.peers_file, table.snapshot(), &err)) {
      lansocial::log(err);
      events.push(Event::status("Cannot save manual peers: " + err));
    }
  }

  void close_workers() {
    listener.stop();
    broadcaster.stop();
    chat.stop();
    gc_timer.cancel();
  }

  EngineOptions opt;
  lansocial::NodeIdentity identity;
  PeerTable table;
  EventQueue events;
  std::atomic<uint16_t> chat_port{kNoPort};
  std::atomic<bool> chat_serving{false};
  std::mutex persist_m;

  boost::asio::io_context io;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work;
  std::thread io_thread;

  DiscoveryListener listener;
  DiscoveryBroadcaster broadcaster;
  ChatServer chat;
  boost::asio::steady_timer gc_timer;
};

SocialEngine::SocialEngine(EngineOptions opt) : impl_(std::make_unique<Impl>(std::move(opt))) {
  lansocial::log("node id " + std::string(impl_->identity.id()));
}

SocialEngine::~SocialEngine() { stop(); }

void SocialEngine::start() {
  if (impl_->work) return;
  auto& d = *impl_;

  d.load_manual_peers();

  const uint16_t port = allocate_port(d.io, d.opt.chat_base, d.opt.chat_span);
  if (port != kNoPort && d.chat.start(port)) {
    d.chat_port = port;
    d.chat_serving = true;
    d.events.push(Event::status("Chat TCP listening on port " + std::to_string(port)));
  } else {
    d.chat_port = kNoPort;
    d.chat_serving = false;
    if (port == kNoPort) {
      lansocial::log("no free chat port in [" + std::to_string(d.opt.chat_base) + ", +" +
                     std::to_string(d.opt.chat_span) + ")");
      d.events.push(Event::status("No free TCP chat port available"));
    }
  }

  d.listener.set_local_addresses(lansocial::netif::local_ipv4_addresses());
  d.listener.start();
  d.broadcaster.start();
  d.schedule_gc();

  d.work.emplace(boost::asio::make_work_guard(d.io));
  d.io_thread = std::thread([this] { impl_->io.run(); });
}

void SocialEngine::stop() {
  if (!impl_->work) return;
  auto& d = *impl_;
  d.work.reset();

  // Sockets belong to the network thread; close them there before stopping it.
  std::promise<void> closed;
  auto done = closed.get_future();
  boost::asio::post(d.io, [&d, &closed] {
    d.close_workers();
    closed.set_value();
  });
  done.wait();

  d.io.stop();
  if (d.io_thread.joinable()) d.io_thread.join();
  d.io.restart();
  d.chat_serving = false;
  d.chat_port = kNoPort;
  lansocial::log("social engine stopped");
}

bool SocialEngine::running() const { return impl_->work.has_value(); }

boost::system::error_code SocialEngine::send_chat(const std::string& host, uint16_t port, std::string_view text) {
  const std::string line = make_chat_line(impl_->self_info(), text);
  const auto ec = send_chat_line(host, port, line, impl_->opt.send_timeout);
  if (ec) lansocial::log("chat to " + lansocial::host_port_key(host, port) + " failed: " + ec.message());
  return ec;
}

DeliveryResult SocialEngine::deliver(const Peer& selected, std::string_view text) {
  DeliveryResult r;
  const auto candidates = resolve_send_candidates(selected, impl_->table.snapshot());
  if (candidates.empty()) {
    r.last_error = boost::asio::error::not_found;
    return r;
  }

  const std::string selected_key = selected.key();
  for (const auto& c : candidates) {
    ++r.attempts;
    const auto ec = send_chat(c.host, c.port, text);
    if (ec) {
      r.last_error = ec;
      continue;
    }
    r.ok = true;
    r.host = c.host;
    r.port = c.port;
    r.key = c.key;
    r.via_fallback = c.key != selected_key;
    r.last_error.clear();
    return r;
  }
  return r;
}

std::optional<Peer> selection_after_delivery(const Peer& target, const DeliveryResult& r, const PeerTable& table) {
  if (!r.ok) return std::nullopt;
  if (!r.via_fallback) return target;
  if (auto moved = table.find(r.key)) return moved;
  Peer p = target;
  p.host = r.host;
  p.port = r.port;
  return p;
}

EventQueue& SocialEngine::events() { return impl_->events; }

PeerTable& SocialEngine::peer_table() { return impl_->table; }

std::vector<Peer> SocialEngine::peers() const { return impl_->table.snapshot(); }

std::optional<Peer> SocialEngine::add_manual_peer(std::string_view text) {
  const auto parsed = lansocial::parse_manual_peer(text);
  if (!parsed) return std::nullopt;

  Peer stored;
  if (impl_->table.upsert(*parsed, &stored)) impl_->events.push(Event::peer_up(stored));
  impl_->persist_manual_peers();
  return stored;
}

bool SocialEngine::remove_manual_peer(const std::string& key) {
  const auto existing = impl_->table.find(key);
  if (!existing || existing->source != PeerSource::Manual) return false;
  if (!impl_->table.remove(key)) return false;
  impl_->events.push(Event::peer_down(key));
  impl_->persist_manual_peers();
  return true;
}

std::vector<std::string> SocialEngine::local_endpoints() const {
  const uint16_t port = chat_port();
  std::vector<std::string> out;
  for (const auto& a : lansocial::netif::local_ipv4_addresses()) {
    out.push_back(lansocial::host_port_key(a.to_string(), port));
  }
  if (out.empty()) out.push_back(lansocial::host_port_key("127.0.0.1", port));
  return out;
}

bool SocialEngine::chat_enabled() const { return impl_->chat_serving.load(); }

uint16_t SocialEngine::chat_port() const { return impl_->chat_port.load(); }

std::string_view SocialEngine::node_id() const { return impl_->identity.id(); }

SelfInfo SocialEngine::self_info() const { return impl_->self_info(); }

} // namespace social
