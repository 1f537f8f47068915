#pragma once

#include "lansocial/util.hpp"

#include <boost/asio/ip/address_v4.hpp>

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace lansocial::netif {

using boost::asio::ip::address_v4;

struct Ipv4Interface {
  std::string name;
  address_v4 address;
  address_v4 broadcast; // unspecified when the interface has none
};

inline address_v4 to_address(const sockaddr* sa) {
  const auto* in = reinterpret_cast<const sockaddr_in*>(sa);
  return address_v4(ntohl(in->sin_addr.s_addr));
}

// Up, non-loopback IPv4 interfaces.
inline std::vector<Ipv4Interface> ipv4_interfaces() {
  std::vector<Ipv4Interface> out;
  ifaddrs* ifaddr = nullptr;
  if (getifaddrs(&ifaddr) != 0 || !ifaddr) return out;

  for (auto* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
    if (!(ifa->ifa_flags & IFF_UP)) continue;
    if (ifa->ifa_flags & IFF_LOOPBACK) continue;

    Ipv4Interface info;
    info.name = ifa->ifa_name ? ifa->ifa_name : "";
    info.address = to_address(ifa->ifa_addr);
    if (info.address.is_loopback()) continue;

    if ((ifa->ifa_flags & IFF_BROADCAST) && ifa->ifa_broadaddr) {
      info.broadcast = to_address(ifa->ifa_broadaddr);
    } else if (ifa->ifa_netmask) {
      const uint32_t ip = info.address.to_uint();
      const uint32_t mask = to_address(ifa->ifa_netmask).to_uint();
      if (mask != 0xFFFFFFFFu) info.broadcast = address_v4((ip & mask) | ~mask);
    }
    out.push_back(std::move(info));
  }
  freeifaddrs(ifaddr);
  return out;
}

inline std::vector<address_v4> local_ipv4_addresses() {
  std::vector<address_v4> out;
  for (const auto& itf : ipv4_interfaces()) {
    if (std::find(out.begin(), out.end(), itf.address) == out.end()) out.push_back(itf.address);
  }
  std::sort(out.begin(), out.end());
  return out;
}

// Subnet broadcast addresses of the local interfaces, loopback ranges excluded.
inline std::vector<address_v4> local_ipv4_broadcasts() {
  std::vector<address_v4> out;
  for (const auto& itf : ipv4_interfaces()) {
    if (itf.broadcast.is_unspecified() || itf.broadcast.is_loopback()) continue;
    if (std::find(out.begin(), out.end(), itf.broadcast) == out.end()) out.push_back(itf.broadcast);
  }
  std::sort(out.begin(), out.end());
  return out;
}

// VirtualBox NAT hands out 10.0.2.x; such a VM cannot reach sibling VMs on it.
inline bool is_virtualbox_nat(const address_v4& a) {
  return (a.to_uint() & 0xFFFFFF00u) == 0x0A000200u;
}

inline bool looks_like_virtualbox_nat(const std::vector<address_v4>& addresses) {
  if (addresses.empty()) return false;
  return std::all_of(addresses.begin(), addresses.end(), is_virtualbox_nat);
}

} // namespace lansocial::netif
