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

#include "communication/client.hpp"

#include <spdlog/spdlog.h>

namespace trellis::communication {

Client::~Client() { Close(); }

bool Client::Connect(const io::network::Endpoint &endpoint, std::chrono::milliseconds timeout) {
  if (!socket_.Connect(endpoint)) return false;
  socket_.SetKeepAlive();
  socket_.SetNoDelay();
  if (timeout.count() > 0) {
    auto const seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    auto const micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout - seconds);
    socket_.SetTimeout(static_cast<long>(seconds.count()), static_cast<long>(micros.count()));
  }
  return true;
}

void Client::Close() {
  socket_.Close();
  buffer_.read_end()->Clear();
}

bool Client::Receive(size_t len) {
  auto *read_end = buffer_.read_end();
  if (read_end->size() >= len) return true;
  buffer_.write_end()->Resize(len);
  while (read_end->size() < len) {
    auto space = buffer_.write_end()->Allocate();
    auto const got = socket_.Read(space.data, len - read_end->size());
    if (got <= 0) {
      if (got < 0) spdlog::trace("Receive from {} failed or timed out", socket_.endpoint());
      return false;
    }
    buffer_.write_end()->Written(static_cast<size_t>(got));
  }
  return true;
}

bool Client::Write(std::span<const uint8_t> data, bool have_more) {
  return socket_.Write(data.data(), data.size(), have_more);
}

bool Client::Write(std::string_view data, bool have_more) {
  return Write(std::span{reinterpret_cast<const uint8_t *>(data.data()), data.size()}, have_more);
}

}  // namespace trellis::communication
