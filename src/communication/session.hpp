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

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include "communication/buffer.hpp"
#include "communication/exceptions.hpp"
#include "io/network/socket.hpp"

namespace trellis::communication {

/// Bytes received on a connection and not yet consumed by the protocol.
using InputStream = Buffer::ReadEnd;

/// Blocking writer for the responses of a protocol session.
class OutputStream final {
 public:
  explicit OutputStream(io::network::Socket *socket) : socket_(socket) {}

  OutputStream(const OutputStream &) = delete;
  OutputStream(OutputStream &&) = delete;
  OutputStream &operator=(const OutputStream &) = delete;
  OutputStream &operator=(OutputStream &&) = delete;
  ~OutputStream() = default;

  bool Write(const uint8_t *data, size_t len, bool have_more = false) { return socket_->Write(data, len, have_more); }

  bool Write(std::string_view data, bool have_more = false) {
    return Write(reinterpret_cast<const uint8_t *>(data.data()), data.size(), have_more);
  }

 private:
  io::network::Socket *socket_;
};

/**
 * One accepted connection. Owns the socket and the receive buffer and feeds
 * every chunk read from the socket to the protocol session.
 *
 * `TSession` is constructed from
 * `(TSessionData *, const io::network::Endpoint &, InputStream *, OutputStream *)`
 * and its `Execute()` consumes every complete message in the input stream,
 * leaving a trailing partial message in place. It reports a protocol error by
 * throwing, which makes the listener close the connection.
 */
template <class TSession, class TSessionData>
class Session final {
 public:
  Session(io::network::Socket &&socket, TSessionData *data)
      : socket_(std::move(socket)),
        output_stream_(&socket_),
        session_(data, socket_.endpoint(), input_buffer_.read_end(), &output_stream_) {
    socket_.SetNonBlocking();
    socket_.SetKeepAlive();
    socket_.SetNoDelay();
  }

  Session(const Session &) = delete;
  Session(Session &&) = delete;
  Session &operator=(const Session &) = delete;
  Session &operator=(Session &&) = delete;
  ~Session() = default;

  /**
   * Reads one chunk from the socket and executes the protocol on it.
   *
   * @return true once the socket has no more data, false if it should be
   *         called again
   * @throw SessionClosedException when the peer closed the connection
   * @throw SessionException on a socket error
   */
  bool Execute() {
    auto space = input_buffer_.write_end()->Allocate();
    if (space.len == 0) {
      input_buffer_.write_end()->Resize(input_buffer_.read_end()->size() * 2);
      space = input_buffer_.write_end()->Allocate();
    }

    auto const got = socket_.Read(space.data, space.len, true);
    if (got < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return true;
      throw SessionException("Couldn't read from {}", socket_.endpoint());
    }
    if (got == 0) throw SessionClosedException("{} closed the connection", socket_.endpoint());

    input_buffer_.write_end()->Written(static_cast<size_t>(got));
    session_.Execute();
    return false;
  }

  io::network::Socket &socket() { return socket_; }

 private:
  io::network::Socket socket_;
  Buffer input_buffer_;
  OutputStream output_stream_;
  TSession session_;
};

}  // namespace trellis::communication
