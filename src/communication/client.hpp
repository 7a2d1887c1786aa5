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
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "communication/buffer.hpp"
#include "io/network/endpoint.hpp"
#include "io/network/socket.hpp"

namespace trellis::communication {

/**
 * Blocking TCP client. Received bytes accumulate in an internal buffer until
 * the caller consumes them, so a framed protocol can first wait for a header
 * and then for the body it announces:
 *
 *   client.Receive(kHeaderSize);
 *   auto size = DecodeSize(client.Received().data());
 *   client.Consume(kHeaderSize);
 *   client.Receive(size);
 */
class Client final {
 public:
  Client() = default;
  ~Client();

  Client(const Client &) = delete;
  Client(Client &&) = delete;
  Client &operator=(const Client &) = delete;
  Client &operator=(Client &&) = delete;

  /// Connects to `endpoint`. Once connected, `Receive` and `Write` give up
  /// after `timeout` without progress. A zero timeout waits forever.
  bool Connect(const io::network::Endpoint &endpoint,
               std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

  bool IsConnected() const { return socket_.IsOpen(); }

  /// Closes the socket and drops unread data.
  void Close();

  /// Blocks until at least `len` unread bytes are buffered. Returns false when
  /// the peer closed the connection, the socket failed or timed out first.
  bool Receive(size_t len);

  /// Unread bytes, oldest first.
  std::span<const uint8_t> Received() { return {buffer_.read_end()->data(), buffer_.read_end()->size()}; }

  /// Drops the first `len` unread bytes.
  void Consume(size_t len) { buffer_.read_end()->Shift(len); }

  bool Write(std::span<const uint8_t> data, bool have_more = false);
  bool Write(std::string_view data, bool have_more = false);

 private:
  io::network::Socket socket_;
  Buffer buffer_;
};

}  // namespace trellis::communication
