#pragma once

#include <boost/asio/io_context.hpp>

#include <cstdint>

namespace social {

constexpr uint16_t kNoPort = 0;

// First TCP port in [base, base + span) that binds on 0.0.0.0, or kNoPort.
// The probe socket is closed again; the chat server binds the port for real.
uint16_t allocate_port(boost::asio::io_context& io, uint16_t base, uint16_t span);

} // namespace social
