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

#include "io/network/addrinfo.hpp"

#include <sys/socket.h>

#include <cstring>

#include "io/network/network_error.hpp"

namespace trellis::io::network {

AddrInfo::~AddrInfo() {
  if (info_ != nullptr) freeaddrinfo(info_);
}

AddrInfo AddrInfo::Get(const Endpoint &endpoint, bool passive) {
  addrinfo hints{};
  switch (endpoint.family) {
    case Endpoint::IpFamily::IP4:
      hints.ai_family = AF_INET;
      break;
    case Endpoint::IpFamily::IP6:
      hints.ai_family = AF_INET6;
      break;
    case Endpoint::IpFamily::NONE:
      hints.ai_family = AF_UNSPEC;
      break;
  }
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_NUMERICSERV | (passive ? AI_PASSIVE : 0);

  addrinfo *result = nullptr;
  auto const port = std::to_string(endpoint.port);
  auto status = getaddrinfo(endpoint.address.c_str(), port.c_str(), &hints, &result);
  if (status != 0) throw NetworkError("Couldn't resolve {}: {}", endpoint, gai_strerror(status));

  return AddrInfo(result);
}

}  // namespace trellis::io::network
