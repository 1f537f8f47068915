#include "src/social/chat_transport.h"

#include "lansocial/framing.hpp"
#include "lansocial/util.hpp"
#include "src/social/wire.h"

#include <functional>
#include <memory>
#include <utility>

namespace social {

using boost::asio::ip::tcp;

namespace {

class InboundChat : public std::enable_shared_from_this<InboundChat> {
 public:
  using OnPayload = std::function<void(std::string_view payload, const std::string& remote_host)>;

  InboundChat(tcp::socket socket, OnPayload on_payload)
      : socket_(std::move(socket)),
        deadline_(socket_.get_executor()),
        buf_(lansocial::kMaxChatPayload),
        on_payload_(std::move(on_payload)) {}

  void start() {
    boost::system::error_code ec;
    const auto ep = socket_.remote_endpoint(ec);
    if (ec) return close();
    remote_host_ = ep.address().to_string();

    auto self = shared_from_this();
    deadline_.expires_after(kInboundReadDeadline);
    deadline_.async_wait([self](const boost::system::error_code& ec2) {
      if (ec2) return;
      lansocial::log("chat connection from " + self->remote_host_ + " timed out");
      self->close();
    });

    boost::asio::async_read(socket_, buf_, boost::asio::transfer_all(),
                            [self](const boost::system::error_code& ec2, std::size_t) {
      self->deadline_.cancel();
      // EOF is the normal end of a single-message connection; a full buffer is read as-is.
      if (ec2 && ec2 != boost::asio::error::eof && ec2 != boost::asio::error::not_found) {
        if (ec2 != boost::asio::error::operation_aborted) {
          lansocial::log("chat read from " + self->remote_host_ + ": " + ec2.message());
        }
        self->close();
        return;
      }
      const auto data = self->buf_.data();
      const std::string payload(boost::asio::buffers_begin(data), boost::asio::buffers_end(data));
      self->close();
      if (self->on_payload_) self->on_payload_(payload, self->remote_host_);
    });
  }

 private:
  void close() {
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  tcp::socket socket_;
  boost::asio::steady_timer deadline_;
  boost::asio::streambuf buf_;
  std::string remote_host_;
  OnPayload on_payload_;
};

} // namespace

ChatServer::ChatServer(boost::asio::io_context& io, PeerTable& table, EventQueue& events)
    : table_(table), events_(events), acceptor_(io) {}

bool ChatServer::start(uint16_t port) {
  if (port == 0) return false;
  boost::system::error_code ec;
  const tcp::endpoint ep(boost::asio::ip::address_v4::any(), port);
  acceptor_.open(ep.protocol(), ec);
  if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor_.bind(ep, ec);
  if (!ec) acceptor_.listen(16, ec);
  if (ec) {
    lansocial::log("failed to bind chat port " + std::to_string(port) + ": " + ec.message());
    events_.push(Event::status("Cannot bind TCP chat port " + std::to_string(port)));
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    return false;
  }
  lansocial::log("chat listening on 0.0.0.0:" + std::to_string(port));
  accept_loop();
  return true;
}

void ChatServer::stop() {
  boost::system::error_code ignored;
  acceptor_.close(ignored);
}

uint16_t ChatServer::port() const {
  boost::system::error_code ec;
  const auto ep = acceptor_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

void ChatServer::accept_loop() {
  acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
    if (ec) {
      if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) return;
      lansocial::log(std::string("accept error: ") + ec.message());
      accept_loop();
      return;
    }
    auto conn = std::make_shared<InboundChat>(
        std::move(socket),
        [this](std::string_view payload, const std::string& host) { handle_payload(payload, host); });
    conn->start();
    accept_loop();
  });
}

std::size_t ChatServer::handle_payload(std::string_view payload, const std::string& remote_host) {
  std::size_t accepted = 0;
  for (std::string_view line : lansocial::split_json_lines(payload)) {
    const auto msg = parse_chat_line(line);
    if (!msg) continue;
    ++accepted;

    const std::string sender = msg->from.empty() ? remote_host : msg->from;
    std::string from_key;
    if (msg->reply_port > 0) {
      // The only way an inbound-only peer's chat port becomes known.
      Peer peer;
      peer.name = sender;
      peer.host = remote_host;
      peer.port = msg->reply_port;
      peer.source = PeerSource::Lan;
      peer.node_id = msg->node_id;
      upsert_and_notify(table_, events_, peer);
      from_key = peer.key();
    }

    const std::string text(lansocial::trim(msg->text));
    if (!text.empty()) events_.push(Event::chat(sender, std::move(from_key), text));
  }
  return accepted;
}

boost::system::error_code send_chat_line(const std::string& host,
                                         uint16_t port,
                                         const std::string& line,
                                         std::chrono::steady_clock::duration timeout) {
  boost::asio::io_context io;
  tcp::resolver resolver(io);
  tcp::socket socket(io);
  boost::asio::steady_timer deadline(io);

  boost::system::error_code result = boost::asio::error::would_block;
  auto finish = [&](const boost::system::error_code& ec) {
    if (result == boost::asio::error::would_block) result = ec;
    deadline.cancel();
    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
  };

  deadline.expires_after(timeout);
  deadline.async_wait([&](const boost::system::error_code& ec) {
    if (ec) return;
    if (result == boost::asio::error::would_block) result = boost::asio::error::timed_out;
    resolver.cancel();
    boost::system::error_code ignored;
    socket.close(ignored);
  });

  auto write_line = [&] {
    boost::asio::async_write(socket, boost::asio::buffer(line),
                             [&](const boost::system::error_code& ec, std::size_t) { finish(ec); });
  };

  boost::system::error_code not_literal;
  const auto literal = boost::asio::ip::make_address(host, not_literal);
  if (!not_literal) {
    socket.async_connect(tcp::endpoint(literal, port), [&](const boost::system::error_code& ec) {
      if (ec) return finish(ec);
      write_line();
    });
  } else {
    // getaddrinfo cannot be interrupted, so a slow name lookup can outlast `timeout`.
    resolver.async_resolve(host, std::to_string(port), tcp::resolver::numeric_service,
                           [&](const boost::system::error_code& ec, tcp::resolver::results_type results) {
      if (ec) return finish(ec);
      boost::asio::async_connect(socket, results, [&](const boost::system::error_code& ec2, const tcp::endpoint&) {
        if (ec2) return finish(ec2);
        write_line();
      });
    });
  }

  io.run();
  return result;
}

} // namespace social
