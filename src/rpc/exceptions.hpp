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

#include <string_view>

#include "utils/exceptions.hpp"

namespace trellis::rpc {

/// Exception that is thrown whenever a RPC call fails: the server can't be
/// reached, the connection breaks or the server closes it.
class RpcFailedException : public utils::BasicException {
 public:
  explicit RpcFailedException(std::string_view msg) : utils::BasicException(msg) {}
  SPECIALIZE_GET_EXCEPTION_NAME(RpcFailedException)
};

class GenericRpcFailedException final : public RpcFailedException {
 public:
  GenericRpcFailedException() : RpcFailedException("Couldn't communicate with the datastore server!") {}
  SPECIALIZE_GET_EXCEPTION_NAME(GenericRpcFailedException)
};

/// The server answered with a message that can't be decoded.
class MalformedRpcMessageException final : public RpcFailedException {
 public:
  explicit MalformedRpcMessageException(std::string_view msg) : RpcFailedException(msg) {}
  SPECIALIZE_GET_EXCEPTION_NAME(MalformedRpcMessageException)
};

}  // namespace trellis::rpc
