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

#include "rpc/server.hpp"

#include <spdlog/spdlog.h>

#include "storage/error.hpp"
#include "storage/serialization.hpp"
#include "utils/logging.hpp"

namespace trellis::rpc {

Server::Server(io::network::Endpoint endpoint, size_t workers_count)
    : server_(std::move(endpoint), this, "RPC", workers_count) {}

bool Server::Start() { return server_.Start(); }

void Server::Shutdown() { server_.Shutdown(); }

void Server::AwaitShutdown() { server_.AwaitShutdown(); }

bool Server::IsRunning() const { return server_.IsRunning(); }

const io::network::Endpoint &Server::endpoint() const { return server_.endpoint(); }

void Server::Register(std::string_view type, Callback callback) {
  auto guard = std::lock_guard{lock_};
  TR_ASSERT(!server_.IsRunning(), "You can't register RPCs when the server is running!");
  auto got = callbacks_.emplace(std::string(type), std::move(callback));
  TR_ASSERT(got.second, "Callback for {} is already registered", type);
  spdlog::trace("[RpcServer] registered {}", type);
}

nlohmann::json Server::Dispatch(const nlohmann::json &request) const {
  // Callbacks are only registered before the server starts, so the map is
  // read without locking.
  auto const type = storage::RequireString(request, "type");
  auto it = callbacks_.find(type);
  if (it == callbacks_.end()) throw storage::SerializationException("Unknown request type '{}'", type);
  spdlog::trace("[RpcServer] received {}", type);
  return it->second(request);
}

}  // namespace trellis::rpc
