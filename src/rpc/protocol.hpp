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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "communication/session.hpp"
#include "io/network/endpoint.hpp"
#include "utils/exceptions.hpp"

/**
 * @brief Protocol
 *
 * Server side of the RPC protocol.
 *
 * Message layout: uint32_t message_size (big-endian),
 *                 message_size bytes of a UTF-8 JSON document
 *
 * Every request is answered with exactly one response, in order.
 */
namespace trellis::rpc {

class Server;

inline constexpr size_t kFrameHeaderSize = sizeof(uint32_t);

/// Largest accepted message. Bigger frames are rejected by both ends.
inline constexpr size_t kMaxMessageSize = 64UL * 1024 * 1024;

/// Prepends the frame header to `payload`.
std::string EncodeFrame(std::string_view payload);

/// Reads the payload size from the first `kFrameHeaderSize` bytes of `data`.
uint32_t DecodeFrameSize(const uint8_t *data);

/**
 * Handles one client connection: cuts complete frames out of the input
 * stream, dispatches them to the server and writes the responses back.
 *
 * A request that can't be decoded is answered with a serialization error,
 * after which the connection is closed because the stream position can no
 * longer be trusted.
 */
class Session {
 public:
  Session(Server *server, const io::network::Endpoint &endpoint, communication::InputStream *input_stream,
          communication::OutputStream *output_stream);

  void Execute();

 private:
  void Respond(const nlohmann::json &response);

  Server *server_;
  io::network::Endpoint endpoint_;
  communication::InputStream *input_stream_;
  communication::OutputStream *output_stream_;
};

}  // namespace trellis::rpc
