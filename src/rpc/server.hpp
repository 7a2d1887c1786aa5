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

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include <nlohmann/json.hpp>

#include "communication/server.hpp"
#include "io/network/endpoint.hpp"
#include "rpc/protocol.hpp"

namespace trellis::rpc {

/// RPC server. Requests are routed by their `"type"` field to the callback
/// registered for it. Callbacks run on the network worker threads and must
/// be thread safe.
class Server {
 public:
  /// Returns the complete response for one request. Throws
  /// `storage::SerializationException` when the request is malformed.
  using Callback = std::function<nlohmann::json(const nlohmann::json &request)>;

  Server(io::network::Endpoint endpoint, size_t workers_count = std::thread::hardware_concurrency());
  Server(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(const Server &) = delete;
  Server &operator=(Server &&) = delete;
  ~Server() = default;

  bool Start();
  void Shutdown();
  void AwaitShutdown();
  bool IsRunning() const;

  const io::network::Endpoint &endpoint() const;

  /// Must be called before `Start`.
  void Register(std::string_view type, Callback callback);

 private:
  friend class Session;

  nlohmann::json Dispatch(const nlohmann::json &request) const;

  std::mutex lock_;
  std::map<std::string, Callback, std::less<>> callbacks_;
  communication::Server<Session, Server> server_;
};

}  // namespace trellis::rpc
