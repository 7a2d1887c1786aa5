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

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace trellis::io::network {

/**
 * This class represents a network endpoint that is used in Socket.
 * It is used when connecting to an address and to get the current
 * connection address.
 *
 * The address is either a numeric IPv4/IPv6 address or a hostname which is
 * resolved when the socket binds or connects.
 */
struct Endpoint {
  enum class IpFamily : std::uint8_t { NONE, IP4, IP6 };

  Endpoint() = default;
  Endpoint(std::string address, uint16_t port);

  /// Parses "<address>:<port>", "[<ipv6>]:<port>" or a bare address when
  /// `default_port` is given. Returns std::nullopt on malformed input.
  static std::optional<Endpoint> ParseSocketOrAddress(std::string_view address,
                                                      std::optional<uint16_t> default_port = std::nullopt);

  static IpFamily GetIpFamily(std::string_view address);

  std::string SocketAddress() const;

  bool operator==(const Endpoint &other) const = default;
  friend std::ostream &operator<<(std::ostream &os, const Endpoint &endpoint);

  std::string address;
  uint16_t port{0};
  IpFamily family{IpFamily::NONE};
};

}  // namespace trellis::io::network

template <>
struct fmt::formatter<trellis::io::network::Endpoint> : fmt::ostream_formatter {};
