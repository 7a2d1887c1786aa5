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

#include "rpc/client.hpp"

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "rpc/protocol.hpp"

namespace trellis::rpc {

Client::Client(io::network::Endpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {}

nlohmann::json Client::Call(const nlohmann::json &request) {
  auto guard = std::lock_guard{mutex_};
  try {
    return Exchange(request);
  } catch (const RpcFailedException &) {
    // The stream position is unknown after any failure, start over with a
    // fresh connection on the next call.
    client_ = std::nullopt;
    throw;
  }
}

nlohmann::json Client::Exchange(const nlohmann::json &request) {
  if (!client_) {
    client_.emplace();
    if (!client_->Connect(endpoint_, timeout_)) {
      spdlog::debug("Couldn't connect to the RPC server at {}", endpoint_);
      throw RpcFailedException(fmt::format("Couldn't connect to {}", endpoint_));
    }
  }

  auto const payload = request.dump();
  if (payload.size() > kMaxMessageSize) throw RpcFailedException("Request exceeds the maximum message size");
  if (!client_->Write(EncodeFrame(payload))) throw GenericRpcFailedException();

  if (!client_->Receive(kFrameHeaderSize)) throw GenericRpcFailedException();
  auto const message_size = DecodeFrameSize(client_->Received().data());
  client_->Consume(kFrameHeaderSize);
  if (message_size > kMaxMessageSize) {
    throw MalformedRpcMessageException(fmt::format("Response of {} bytes exceeds the maximum size", message_size));
  }
  if (!client_->Receive(message_size)) throw GenericRpcFailedException();

  auto const body = client_->Received().first(message_size);
  nlohmann::json response;
  try {
    response = nlohmann::json::parse(body.begin(), body.end());
  } catch (const nlohmann::json::parse_error &e) {
    throw MalformedRpcMessageException(e.what());
  }
  client_->Consume(message_size);
  return response;
}

}  // namespace trellis::rpc
