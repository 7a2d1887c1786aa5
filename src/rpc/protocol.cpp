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

#include "rpc/protocol.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "rpc/messages.hpp"
#include "rpc/server.hpp"
#include "storage/error.hpp"

namespace trellis::rpc {

namespace {

constexpr auto kBufferRetainLimit = 4 * 1024 * 1024;  // 4MiB

}  // namespace

std::string EncodeFrame(std::string_view payload) {
  auto const size = static_cast<uint32_t>(payload.size());
  std::string frame;
  frame.reserve(kFrameHeaderSize + payload.size());
  for (int shift = 24; shift >= 0; shift -= 8) frame.push_back(static_cast<char>((size >> shift) & 0xFF));
  frame.append(payload);
  return frame;
}

uint32_t DecodeFrameSize(const uint8_t *data) {
  return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
         (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
}

Session::Session(Server *server, const io::network::Endpoint &endpoint, communication::InputStream *input_stream,
                 communication::OutputStream *output_stream)
    : server_(server), endpoint_(endpoint), input_stream_(input_stream), output_stream_(output_stream) {}

void Session::Execute() {
  while (input_stream_->size() >= kFrameHeaderSize) {
    auto const message_size = DecodeFrameSize(input_stream_->data());
    if (message_size > kMaxMessageSize) {
      input_stream_->Clear();
      Respond(ErrorResponse(storage::Error::Serialization("Message exceeds the maximum size")));
      throw communication::SessionException("Received a message of {} bytes from {}", message_size, endpoint_);
    }

    auto const frame_size = kFrameHeaderSize + message_size;
    if (input_stream_->size() < frame_size) {
      // Wait for the rest of the message.
      input_stream_->Resize(frame_size);
      return;
    }

    auto const *payload = reinterpret_cast<const char *>(input_stream_->data() + kFrameHeaderSize);
    nlohmann::json response;
    bool malformed = false;
    try {
      auto request = nlohmann::json::parse(payload, payload + message_size);
      response = server_->Dispatch(request);
    } catch (const nlohmann::json::exception &e) {
      malformed = true;
      response = ErrorResponse(storage::Error::Serialization(e.what()));
    } catch (const storage::SerializationException &e) {
      malformed = true;
      response = ErrorResponse(storage::Error::Serialization(e.what()));
    }

    input_stream_->Shift(frame_size);
    Respond(response);

    if (malformed) {
      input_stream_->Clear();
      throw communication::SessionException("Received a malformed request from {}", endpoint_);
    }
  }
  input_stream_->ShrinkBuffer(kBufferRetainLimit);
}

void Session::Respond(const nlohmann::json &response) {
  // Parser errors quote the offending input, which may not be valid UTF-8.
  auto const payload = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  if (!output_stream_->Write(EncodeFrame(payload))) {
    throw communication::SessionException("Couldn't send a response to {}", endpoint_);
  }
}

}  // namespace trellis::rpc
