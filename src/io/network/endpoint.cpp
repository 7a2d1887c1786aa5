// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "io/network/endpoint.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <charconv>
#include <limits>

namespace trellis::io::network {

namespace {

std::optional<uint16_t> ParsePort(std::string_view port_str) {
  uint32_t port = 0;
  auto const *end = port_str.data() + port_str.size();
  auto [ptr, ec] = std::from_chars(port_str.data(), end, port);
  if (ec != std::errc{} || ptr != end || port > std::numeric_limits<uint16_t>::max()) return std::nullopt;
  return static_cast<uint16_t>(port);
}

}  // namespace

Endpoint::Endpoint(std::string address, uint16_t port)
    : address(std::move(address)), port(port), family(GetIpFamily(this->address)) {}

Endpoint::IpFamily Endpoint::GetIpFamily(std::string_view address) {
  auto const address_str = std::string(address);
  in_addr addr4{};
  in6_addr addr6{};
  if (inet_pton(AF_INET, address_str.c_str(), &addr4) == 1) return IpFamily::IP4;
  if (inet_pton(AF_INET6, address_str.c_str(), &addr6) == 1) return IpFamily::IP6;
  return IpFamily::NONE;
}

std::optional<Endpoint> Endpoint::ParseSocketOrAddress(std::string_view address,
                                                       std::optional<uint16_t> default_port) {
  if (address.empty()) return std::nullopt;

  // Bracketed IPv6 address, optionally followed by a port.
  if (address.front() == '[') {
    auto const closing = address.find(']');
    if (closing == std::string_view::npos) return std::nullopt;
    auto host = address.substr(1, closing - 1);
    if (GetIpFamily(host) != IpFamily::IP6) return std::nullopt;
    auto rest = address.substr(closing + 1);
    if (rest.empty()) {
      if (!default_port) return std::nullopt;
      return Endpoint(std::string(host), *default_port);
    }
    if (rest.front() != ':') return std::nullopt;
    auto port = ParsePort(rest.substr(1));
    if (!port) return std::nullopt;
    return Endpoint(std::string(host), *port);
  }

  // A bare IPv6 address can't carry a port.
  if (GetIpFamily(address) == IpFamily::IP6) {
    if (!default_port) return std::nullopt;
    return Endpoint(std::string(address), *default_port);
  }

  auto const colon = address.rfind(':');
  if (colon == std::string_view::npos) {
    if (!default_port) return std::nullopt;
    return Endpoint(std::string(address), *default_port);
  }
  auto host = address.substr(0, colon);
  if (host.empty()) return std::nullopt;
  auto port = ParsePort(address.substr(colon + 1));
  if (!port) return std::nullopt;
  return Endpoint(std::string(host), *port);
}

std::string Endpoint::SocketAddress() const {
  if (family == IpFamily::IP6) return fmt::format("[{}]:{}", address, port);
  return fmt::format("{}:{}", address, port);
}

std::ostream &operator<<(std::ostream &os, const Endpoint &endpoint) { return os << endpoint.SocketAddress(); }

}  // namespace trellis::io::network
