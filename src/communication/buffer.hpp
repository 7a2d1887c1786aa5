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
#include <vector>

#include "io/network/stream_buffer.hpp"

namespace trellis::communication {

/**
 * Growable byte buffer used by the network stack.
 *
 * The writer asks for free space with `Allocate`, fills it and reports the
 * filled amount with `Written`. The reader consumes from the front with
 * `data`/`size` and drops consumed bytes with `Shift`. Both ends are exposed
 * as separate views so a session can only read what the network wrote.
 *
 * Not thread safe, a buffer belongs to one session which is executed by one
 * thread at a time.
 */
class Buffer final {
  static constexpr size_t kBufferInitialSize = 65'536;

 public:
  Buffer();

  Buffer(const Buffer &) = delete;
  Buffer(Buffer &&) = delete;
  Buffer &operator=(const Buffer &) = delete;
  Buffer &operator=(Buffer &&) = delete;
  ~Buffer() = default;

  /// Reading side of the buffer.
  class ReadEnd {
   public:
    explicit ReadEnd(Buffer *buffer) : buffer_(buffer) {}

    ReadEnd(const ReadEnd &) = delete;
    ReadEnd(ReadEnd &&) = delete;
    ReadEnd &operator=(const ReadEnd &) = delete;
    ReadEnd &operator=(ReadEnd &&) = delete;
    ~ReadEnd() = default;

    uint8_t *data() { return buffer_->data_.data(); }
    size_t size() const { return buffer_->have_; }

    /// Drops the first `len` readable bytes.
    void Shift(size_t len) { buffer_->Shift(len); }

    /// Makes room for at least `len` readable bytes in total, used once the
    /// size of an incoming message is known.
    void Resize(size_t len) { buffer_->Resize(len); }

    void Clear() { buffer_->have_ = 0; }

    /// Releases memory above `size` bytes unless it holds unread data.
    void ShrinkBuffer(size_t size) { buffer_->ShrinkBuffer(size); }

   private:
    Buffer *buffer_;
  };

  /// Writing side of the buffer.
  class WriteEnd {
   public:
    explicit WriteEnd(Buffer *buffer) : buffer_(buffer) {}

    WriteEnd(const WriteEnd &) = delete;
    WriteEnd(WriteEnd &&) = delete;
    WriteEnd &operator=(const WriteEnd &) = delete;
    WriteEnd &operator=(WriteEnd &&) = delete;
    ~WriteEnd() = default;

    /// Free space after the readable bytes. Never write more than `len`.
    io::network::StreamBuffer Allocate() { return buffer_->Allocate(); }

    /// Marks `len` bytes of the last allocation as readable.
    void Written(size_t len) { buffer_->Written(len); }

    void Resize(size_t len) { buffer_->Resize(len); }

    void Clear() { buffer_->have_ = 0; }

   private:
    Buffer *buffer_;
  };

  ReadEnd *read_end() { return &read_end_; }
  WriteEnd *write_end() { return &write_end_; }

 private:
  void Shift(size_t len);
  io::network::StreamBuffer Allocate();
  void Written(size_t len);
  void Resize(size_t len);
  void ShrinkBuffer(size_t new_size);

  std::vector<uint8_t> data_;
  size_t have_{0};
  ReadEnd read_end_;
  WriteEnd write_end_;
};

}  // namespace trellis::communication
