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

#include "communication/buffer.hpp"

#include <algorithm>
#include <cstddef>

#include "utils/logging.hpp"

namespace trellis::communication {

Buffer::Buffer() : data_(kBufferInitialSize), read_end_(this), write_end_(this) {}

void Buffer::Shift(size_t len) {
  DTR_ASSERT(len <= have_, "Shifting {} bytes out of a buffer holding {}", len, have_);
  std::copy(data_.begin() + static_cast<std::ptrdiff_t>(len), data_.begin() + static_cast<std::ptrdiff_t>(have_),
            data_.begin());
  have_ -= len;
}

io::network::StreamBuffer Buffer::Allocate() { return {data_.data() + have_, data_.size() - have_}; }

void Buffer::Written(size_t len) {
  DTR_ASSERT(have_ + len <= data_.size(), "Wrote {} bytes past the allocated space", have_ + len - data_.size());
  have_ += len;
}

void Buffer::Resize(size_t len) {
  if (len > data_.size()) data_.resize(len);
}

void Buffer::ShrinkBuffer(size_t new_size) {
  if (new_size >= data_.size() || new_size < have_) return;
  data_.resize(new_size);
  data_.shrink_to_fit();
}

}  // namespace trellis::communication
