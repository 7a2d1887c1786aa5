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

#include <chrono>
#include <mutex>
#include <optional>

#include <nlohmann/json.hpp>

#include "communication/client.hpp"
#include "io/network/endpoint.hpp"
#include "rpc/exceptions.hpp"

namespace trellis::rpc {

/// Client side of the RPC protocol. Client is thread safe, concurrent calls
/// are serialized over a single connection. The connection is opened on the
/// first call and reopened by the call after a failure. Calls are never
/// retried.
class Client {
 public:
  static constexpr std::chrono::milliseconds kDefaultTimeout{std::chrono::seconds(30)};

  /// A call fails with `RpcFailedException` once the server stays silent for
  /// `timeout`. A zero timeout waits forever.
  explicit Client(io::network::Endpoint endpoint, std::chrono::milliseconds timeout = kDefaultTimeout);

  Client(const Client &) = delete;
  Client(Client &&) = delete;
  Client &operator=(const Client &) = delete;
  Client &operator=(Client &&) = delete;
  ~Client() = default;

  /// Sends `request` and waits for its response.
  ///
  /// @throw MalformedRpcMessageException if the response can't be decoded.
  /// @throw RpcFailedException if the exchange fails.
  nlohmann::json Call(const nlohmann::json &request);

  const io::network::Endpoint &endpoint() const { return endpoint_; }

 private:
  nlohmann::json Exchange(const nlohmann::json &request);

  io::network::Endpoint endpoint_;
  std::chrono::milliseconds timeout_;
  std::optional<communication::Client> client_;
  std::mutex mutex_;
};

}  // namespace trellis::rpc
