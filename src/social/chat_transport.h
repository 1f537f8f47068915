#pragma once

#include "src/social/event_queue.h"
#include "src/social/peer_table.h"

#include <utility>  // needed before Boost 1.74 asio (std::exchange in awaitable.hpp)
#include <boost/asio.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace social {

constexpr auto kSendTimeout = std::chrono::seconds(4);
constexpr auto kInboundReadDeadline = std::chrono::seconds(5);

// Accepts single-message connections on the chat port. Each connection is read
// to EOF, split into lines, and every valid chat line becomes a Chat event.
class ChatServer {
 public:
  using tcp = boost::asio::ip::tcp;

  ChatServer(boost::asio::io_context& io, PeerTable& table, EventQueue& events);

  // Pushes a status event and returns false when the port cannot be bound.
  bool start(uint16_t port);
  void stop();

  bool serving() const { return acceptor_.is_open(); }
  uint16_t port() const;

  // Returns the number of chat lines accepted from `payload`.
  std::size_t handle_payload(std::string_view payload, const std::string& remote_host);

 private:
  void accept_loop();

  PeerTable& table_;
  EventQueue& events_;
  tcp::acceptor acceptor_;
};

// Connects to host:port, writes `line`, closes. Returns an empty error_code on success.
// Literal addresses block the calling thread for at most `timeout`; host names add
// the system resolver's own lookup time, which the deadline cannot cut short.
boost::system::error_code send_chat_line(const std::string& host,
                                         uint16_t port,
                                         const std::string& line,
                                         std::chrono::steady_clock::duration timeout = kSendTimeout);

} // namespace social
