#include "src/social/port_allocator.h"

#include <boost/asio/ip/tcp.hpp>

namespace social {

using boost::asio::ip::tcp;

uint16_t allocate_port(boost::asio::io_context& io, uint16_t base, uint16_t span) {
  if (base == 0) return kNoPort;
  for (uint32_t port = base; port < static_cast<uint32_t>(base) + span && port <= 65535; ++port) {
    boost::system::error_code ec;
    tcp::acceptor probe(io);
    probe.open(tcp::v4(), ec);
    if (ec) continue;
    probe.set_option(tcp::acceptor::reuse_address(true), ec);
    probe.bind(tcp::endpoint(boost::asio::ip::address_v4::any(), static_cast<uint16_t>(port)), ec);
    boost::system::error_code ignored;
    probe.close(ignored);
    if (!ec) return static_cast<uint16_t>(port);
  }
  return kNoPort;
}

} // namespace social
