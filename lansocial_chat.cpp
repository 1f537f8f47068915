#include "lansocial/netif.hpp"
#include "lansocial/peer_store.hpp"
#include "lansocial/util.hpp"
#include "src/social/social_engine.h"

#include <utility>  // needed before Boost 1.74 asio (std::exchange in awaitable.hpp)
#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unistd.h>

using social::Event;
using social::Peer;

namespace {

constexpr auto kEventPollInterval = std::chrono::milliseconds(120);

class App : public std::enable_shared_from_this<App> {
 public:
  struct Options {
    std::string nickname = "Player1";
    uint16_t discovery_port = 38655;
    uint16_t chat_base = 38600;
    std::filesystem::path peers_file;
    bool no_persist = false;
  };

  App(boost::asio::io_context& io, social::SocialEngine& engine)
      : io_(io),
        engine_(engine),
        signals_(io, SIGINT, SIGTERM),
        poll_timer_(io),
        stdin_(io, ::dup(STDIN_FILENO)) {}

  void run() {
    signals_.async_wait([self = shared_from_this()](const boost::system::error_code& ec, int) {
      if (ec) return;
      lansocial::log("signal received, shutting down");
      self->shutdown();
    });

    engine_.start();
    system_line("Node " + std::string(engine_.node_id()) + " online. Type /help for commands.");
    schedule_poll();
    start_stdin_read();
  }

 private:
  static void print(const std::string& who, const std::string& text) {
    std::cout << "[" << lansocial::local_clock_hms() << "] " << who << ": " << text << "\n";
    std::cout.flush();
  }

  static void system_line(const std::string& text) {
    std::cout << "[" << lansocial::local_clock_hms() << "] [SYSTEM] " << text << "\n";
    std::cout.flush();
  }

  static std::string describe(const Peer& p) {
    return p.name + " (" + p.key() + ", " + std::string(lansocial::source_to_string(p.source)) + ")";
  }

  void schedule_poll() {
    poll_timer_.expires_after(kEventPollInterval);
    poll_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
      if (ec || self->shutting_down_) return;
      for (const auto& e : self->engine_.events().drain()) self->on_event(e);
      self->schedule_poll();
    });
  }

  void on_event(const Event& e) {
    switch (e.kind) {
      case Event::Kind::PeerUp:
        system_line("Peer online: " + describe(e.peer));
        break;
      case Event::Kind::PeerDown:
        system_line("Peer offline: " + e.key);
        break;
      case Event::Kind::Chat:
        print(e.from, e.text);
        break;
      case Event::Kind::Status:
        system_line(e.text);
        break;
    }
  }

  void start_stdin_read() {
    auto self = shared_from_this();
    boost::asio::async_read_until(stdin_, stdin_buf_, '\n',
                                  [self](const boost::system::error_code& ec, std::size_t) {
                                    if (ec) {
                                      if (ec != boost::asio::error::operation_aborted) {
                                        self->shutdown();
                                      }
                                      return;
                                    }
                                    std::istream is(&self->stdin_buf_);
                                    std::string line;
                                    std::getline(is, line);
                                    if (!line.empty() && line.back() == '\r') line.pop_back();
                                    self->handle_stdin_line(line);
                                    if (!self->shutting_down_) self->start_stdin_read();
                                  });
  }

  // 1-based index into the last listing shown by /peers.
  std::optional<Peer> peer_by_index(std::string_view arg) {
    if (listed_.empty()) listed_ = engine_.peers();
    const auto n = lansocial::parse_port(arg);
    if (!n || *n > listed_.size()) return std::nullopt;
    return listed_[*n - 1];
  }

  void list_peers() {
    listed_ = engine_.peers();
    if (listed_.empty()) {
      system_line("No peers yet. LAN peers appear automatically; use /add for Internet peers.");
      return;
    }
    for (std::size_t i = 0; i < listed_.size(); ++i) {
      const bool active = selected_ && selected_->key() == listed_[i].key();
      system_line(std::string(active ? "* " : "  ") + std::to_string(i + 1) + ". " + describe(listed_[i]));
    }
  }

  void show_ids() {
    system_line("My Peer IDs (share one as host:port):");
    for (const auto& ep : engine_.local_endpoints()) system_line("  " + ep);
    if (!engine_.chat_enabled()) {
      system_line("Chat server is not active; other users cannot reach you.");
    }
    if (lansocial::netif::looks_like_virtualbox_nat(lansocial::netif::local_ipv4_addresses())) {
      system_line("All addresses are VirtualBox NAT (10.0.2.x). Switch the VM network adapter to "
                  "Bridged or Host-Only so other machines can reach you.");
    }
  }

  void send_to(const Peer& target, const std::string& text) {
    const auto r = engine_.deliver(target, text);
    if (!r.ok) {
      system_line("Message to " + target.name + " not delivered after " + std::to_string(r.attempts) +
                  " attempt(s): " + r.last_error.message());
      return;
    }
    print("You -> " + target.name, text);
    if (r.via_fallback) system_line("Delivered via " + r.key + "; selection updated.");
    if (auto next = social::selection_after_delivery(target, r, engine_.peer_table())) selected_ = std::move(*next);
  }

  void handle_stdin_line(const std::string& raw) {
    const std::string line(lansocial::trim(raw));
    if (line.empty()) return;

    if (line == "/quit") {
      shutdown();
      return;
    }

    if (line == "/help") {
      system_line("/peers  /select <n>  /add <alias@host:port|host:port>  /remove <n>  /ids  /msg <n> <text>  /quit");
      return;
    }

    if (line == "/peers") {
      list_peers();
      return;
    }

    if (line == "/ids") {
      show_ids();
      return;
    }

    if (line.rfind("/select ", 0) == 0) {
      const auto p = peer_by_index(line.substr(std::string("/select ").size()));
      if (!p) {
        lansocial::log("usage: /select <n> (see /peers)");
        return;
      }
      selected_ = *p;
      system_line("Chatting with " + describe(*p));
      return;
    }

    if (line.rfind("/add ", 0) == 0) {
      const auto p = engine_.add_manual_peer(line.substr(std::string("/add ").size()));
      if (!p) {
        lansocial::log("usage: /add <alias@host:port|host:port> (port 1-65535)");
        return;
      }
      system_line("Added manual peer " + describe(*p));
      return;
    }

    if (line.rfind("/remove ", 0) == 0) {
      const auto p = peer_by_index(line.substr(std::string("/remove ").size()));
      if (!p) {
        lansocial::log("usage: /remove <n> (see /peers)");
        return;
      }
      if (!engine_.remove_manual_peer(p->key())) {
        system_line(p->key() + " is a LAN peer; only manual peers can be removed.");
        return;
      }
      if (selected_ && selected_->key() == p->key()) selected_.reset();
      listed_.clear();
      system_line("Removed " + p->key());
      return;
    }

    if (line.rfind("/msg ", 0) == 0) {
      const std::string rest = line.substr(std::string("/msg ").size());
      const auto sp = rest.find(' ');
      if (sp == std::string::npos) {
        lansocial::log("usage: /msg <n> <text>");
        return;
      }
      const auto p = peer_by_index(rest.substr(0, sp));
      const std::string text(lansocial::trim(std::string_view(rest).substr(sp + 1)));
      if (!p || text.empty()) {
        lansocial::log("usage: /msg <n> <text>");
        return;
      }
      send_to(*p, text);
      return;
    }

    if (line.front() == '/') {
      lansocial::log("unknown command: " + line + " (try /help)");
      return;
    }

    if (!selected_) {
      system_line("No peer selected. Use /peers and /select <n>.");
      return;
    }
    send_to(*selected_, line);
  }

  void shutdown() {
    if (shutting_down_.exchange(true)) return;

    lansocial::log("shutting down");
    engine_.stop();

    boost::system::error_code ignored;
    signals_.cancel(ignored);
    poll_timer_.cancel();
    stdin_.close(ignored);
    io_.stop();
  }

  boost::asio::io_context& io_;
  social::SocialEngine& engine_;
  boost::asio::signal_set signals_;
  boost::asio::steady_timer poll_timer_;

  std::vector<Peer> listed_;
  std::optional<Peer> selected_;

  boost::asio::posix::stream_descriptor stdin_;
  boost::asio::streambuf stdin_buf_;
  std::atomic<bool> shutting_down_{false};
};

std::optional<App::Options> parse_args(int argc, char** argv) {
  App::Options opt;

  if (const char* v = std::getenv("LANSOCIAL_NAME"); v && *v) opt.nickname = v;
  if (const char* v = std::getenv("LANSOCIAL_DISCOVERY_PORT"); v && *v) {
    const auto p = lansocial::parse_port(v);
    if (!p) return std::nullopt;
    opt.discovery_port = *p;
  }
  if (const char* v = std::getenv("LANSOCIAL_CHAT_BASE"); v && *v) {
    const auto p = lansocial::parse_port(v);
    if (!p) return std::nullopt;
    opt.chat_base = *p;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto get_val = [&](std::string_view flag) -> std::optional<std::string> {
      if (a == flag) {
        if (i + 1 >= argc) return std::nullopt;
        return std::string(argv[++i]);
      }
      return std::nullopt;
    };

    if (auto v = get_val("--name")) {
      opt.nickname = *v;
      continue;
    }
    if (auto v = get_val("--discovery-port")) {
      const auto p = lansocial::parse_port(*v);
      if (!p) return std::nullopt;
      opt.discovery_port = *p;
      continue;
    }
    if (auto v = get_val("--chat-base")) {
      const auto p = lansocial::parse_port(*v);
      if (!p) return std::nullopt;
      opt.chat_base = *p;
      continue;
    }
    if (auto v = get_val("--peers-file")) {
      opt.peers_file = *v;
      continue;
    }
    if (a == "--no-persist") {
      opt.no_persist = true;
      continue;
    }
    return std::nullopt;
  }

  if (opt.nickname.empty() || opt.nickname.size() > 32) return std::nullopt;
  if (opt.nickname.find('\n') != std::string::npos || opt.nickname.find('\r') != std::string::npos) {
    return std::nullopt;
  }
  if (opt.no_persist) {
    opt.peers_file.clear();
  } else if (opt.peers_file.empty()) {
    opt.peers_file = lansocial::peer_store::default_peers_path();
  }
  return opt;
}

void print_usage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--name <nick>] [--discovery-port <port>] [--chat-base <port>] [--peers-file <path>] [--no-persist]\n"
            << "Defaults: name Player1, discovery UDP 38655, chat TCP 38600-38623\n";
}

} // namespace

int main(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    if (std::string_view(argv[i]) == "--help") {
      print_usage(argv[0]);
      return 0;
    }
  }
  const auto opt = parse_args(argc, argv);
  if (!opt) {
    print_usage(argv[0]);
    return 2;
  }

  try {
    social::EngineOptions eo;
    eo.nickname = opt->nickname;
    eo.discovery_port = opt->discovery_port;
    eo.chat_base = opt->chat_base;
    eo.peers_file = opt->peers_file;
    if (!eo.peers_file.empty()) lansocial::log("manual peers file: " + eo.peers_file.string());

    boost::asio::io_context io;
    social::SocialEngine engine(std::move(eo));
    auto app = std::make_shared<App>(io, engine);
    app->run();
    io.run();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return 1;
  }
}
