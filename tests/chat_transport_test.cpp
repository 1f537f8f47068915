#include "src/social/chat_transport.h"
#include "src/social/port_allocator.h"
#include "src/social/wire.h"

#include <utility>  // needed before Boost 1.74 asio (std::exchange in awaitable.hpp)
#include <boost/asio.hpp>

#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using boost::asio::ip::tcp;
using social::ChatServer;
using social::Event;

namespace {

uint16_t unused_loopback_port(boost::asio::io_context& io) {
  tcp::acceptor a(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  return a.local_endpoint().port();
}

std::vector<Event> wait_for_chat(social::EventQueue& events, std::chrono::milliseconds limit) {
  std::vector<Event> seen;
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    for (auto& e : events.drain()) seen.push_back(std::move(e));
    for (const auto& e : seen) {
      if (e.kind == Event::Kind::Chat) return seen;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return seen;
}

} // namespace

int main() {
  social::SelfInfo alice{"a11ce0a11ce0", "alice", 38604, 38655};

  {
    boost::asio::io_context io;
    social::PeerTable table;
    social::EventQueue events;
    ChatServer server(io, table, events);

    const std::string payload = social::make_chat_line(alice, "hi") + social::make_chat_line(alice, "second");
    assert(server.handle_payload(payload, "192.168.1.20") == 2);
    auto ev = events.drain();
    assert(ev.size() == 3);
    assert(ev[0].kind == Event::Kind::PeerUp && ev[0].key == "192.168.1.20:38604");
    assert(ev[0].peer.node_id == "a11ce0a11ce0" && ev[0].peer.name == "alice");
    assert(ev[1].kind == Event::Kind::Chat && ev[1].text == "hi" && ev[1].from == "alice");
    assert(ev[1].from_key == "192.168.1.20:38604");
    assert(ev[2].kind == Event::Kind::Chat && ev[2].text == "second");

    // Garbage and foreign types are dropped without touching the table.
    assert(server.handle_payload("{broken\n{\"type\":\"announce\",\"chat_port\":1}\n[1]\n", "192.168.1.30") == 0);
    assert(events.size() == 0);
    assert(table.size() == 1);

    // No reply port: the sender stays unknown to the table; no name falls back to the address.
    assert(server.handle_payload(R"({"type":"chat","text":"  anon  "})", "192.168.1.31") == 1);
    ev = events.drain();
    assert(ev.size() == 1);
    assert(ev[0].from == "192.168.1.31" && ev[0].text == "anon" && ev[0].from_key.empty());
    assert(table.size() == 1);

    // Blank text is accepted but produces no chat event.
    assert(server.handle_payload(social::make_chat_line(alice, "   "), "192.168.1.20") == 1);
    assert(events.size() == 0);

    assert(!server.start(0));
  }

  {
    // Real connection over loopback.
    boost::asio::io_context io;
    social::PeerTable table;
    social::EventQueue events;
    ChatServer server(io, table, events);
    const uint16_t port = unused_loopback_port(io);
    assert(server.start(port));
    assert(server.serving() && server.port() == port);

    std::thread net([&] { io.run(); });

    const auto ec = social::send_chat_line("127.0.0.1", port, social::make_chat_line(alice, "over tcp"));
    assert(!ec);
    const auto seen = wait_for_chat(events, std::chrono::seconds(3));
    bool got = false;
    for (const auto& e : seen) {
      if (e.kind == Event::Kind::Chat) {
        assert(e.text == "over tcp" && e.from == "alice");
        assert(e.from_key == "127.0.0.1:38604");
        got = true;
      }
    }
    assert(got);
    assert(table.find("127.0.0.1:38604"));

    io.stop();
    net.join();
    server.stop();
  }

  {
    // A port someone else listens on: the server reports it and stays down.
    boost::asio::io_context io;
    social::PeerTable table;
    social::EventQueue events;
    tcp::acceptor busy(io, tcp::endpoint(tcp::v4(), 0));
    const uint16_t port = busy.local_endpoint().port();
    ChatServer server(io, table, events);
    assert(!server.start(port));
    assert(!server.serving());
    assert(server.port() == 0);
    const auto ev = events.drain();
    assert(ev.size() == 1 && ev[0].kind == Event::Kind::Status);
    assert(ev[0].text == "Cannot bind TCP chat port " + std::to_string(port));
  }

  {
    // Nothing listening: the error comes back to the caller.
    boost::asio::io_context io;
    const uint16_t closed = unused_loopback_port(io);
    const auto started = std::chrono::steady_clock::now();
    const auto ec = social::send_chat_line("127.0.0.1", closed, social::make_chat_line(alice, "lost"),
                                           std::chrono::seconds(2));
    assert(ec == boost::asio::error::connection_refused);
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));

    // Names still go through the resolver.
    assert(social::send_chat_line("localhost", closed, social::make_chat_line(alice, "lost"),
                                  std::chrono::seconds(2)));
  }

  {
    // Busy ports are skipped; an exhausted range yields kNoPort.
    boost::asio::io_context io;
    tcp::acceptor busy(io, tcp::endpoint(tcp::v4(), 0));
    const uint16_t p = busy.local_endpoint().port();
    assert(social::allocate_port(io, p, 1) == social::kNoPort);
    busy.close();
    assert(social::allocate_port(io, p, 1) == p);
  }

  return 0;
}
