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

#include <atomic>
#include <string>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "communication/listener.hpp"
#include "io/network/endpoint.hpp"
#include "io/network/socket.hpp"
#include "utils/logging.hpp"
#include "utils/thread.hpp"

namespace trellis::communication {

/**
 * TCP server. An acceptor thread hands every new connection to a `Listener`,
 * which runs `TSession` on it with `workers_count` threads.
 *
 *   acceptor -> listener workers -> Session<TSession> per connection
 *
 * `Shutdown` only flips flags and shuts the listening socket down, so it can
 * be called from a signal handler.
 */
template <typename TSession, typename TSessionData>
class Server final {
  static constexpr int kBacklog = 1024;

 public:
  Server(io::network::Endpoint endpoint, TSessionData *session_data, std::string service_name,
         size_t workers_count = std::thread::hardware_concurrency())
      : endpoint_(std::move(endpoint)),
        listener_(session_data, service_name, workers_count),
        service_name_(std::move(service_name)) {}

  ~Server() {
    TR_ASSERT(!alive_ && !acceptor_.joinable(),
              "Shutdown and AwaitShutdown must be called before the {} server is destroyed", service_name_);
  }

  Server(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(const Server &) = delete;
  Server &operator=(Server &&) = delete;

  /// The bound endpoint, with the port the kernel picked when port 0 was
  /// requested.
  const io::network::Endpoint &endpoint() const {
    TR_ASSERT(alive_, "The {} server isn't running", service_name_);
    return socket_.endpoint();
  }

  /// Binds the endpoint and starts accepting. Returns false if the endpoint
  /// can't be bound or listened on.
  bool Start() {
    TR_ASSERT(!alive_, "The {} server is already running", service_name_);
    if (!socket_.Bind(endpoint_)) {
      spdlog::error("{} can't bind to {}", service_name_, endpoint_);
      return false;
    }
    // Accept wakes up every second to notice a shutdown.
    socket_.SetTimeout(1, 0);
    if (!socket_.Listen(kBacklog)) {
      spdlog::error("{} can't listen on {}", service_name_, endpoint_);
      return false;
    }

    alive_ = true;
    listener_.Start();
    acceptor_ = std::thread([this] {
      utils::ThreadSetName(fmt::format("{} acceptor", service_name_));
      spdlog::info("{} listening on {}", service_name_, socket_.endpoint());
      while (alive_) {
        auto connection = socket_.Accept();
        if (!connection) continue;
        spdlog::debug("{} accepted a connection from {}", service_name_, connection->endpoint());
        listener_.AddConnection(std::move(*connection));
      }
      spdlog::info("{} stopped accepting connections", service_name_);
    });
    return true;
  }

  void Shutdown() {
    alive_ = false;
    socket_.Shutdown();
    listener_.Shutdown();
  }

  void AwaitShutdown() {
    if (acceptor_.joinable()) acceptor_.join();
    listener_.AwaitShutdown();
  }

  bool IsRunning() const { return alive_; }

 private:
  std::atomic<bool> alive_{false};
  std::thread acceptor_;

  io::network::Socket socket_;
  io::network::Endpoint endpoint_;
  Listener<TSession, TSessionData> listener_;

  const std::string service_name_;
};

}  // namespace trellis::communication
