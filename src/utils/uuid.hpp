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

#include <uuid/uuid.h>

#include <array>
#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace trellis::utils {

/// 128-bit identifier backed by libuuid. A default constructed UUID is a
/// fresh random one. Ordering follows the raw bytes, which matches the order
/// of the lower case textual form.
class UUID {
 public:
  using Bytes = std::array<unsigned char, 16>;

  /// Length of the textual form, xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
  static constexpr size_t kStringLength = 36;

  UUID() { uuid_generate_random(bytes_.data()); }
  explicit UUID(Bytes const &bytes) : bytes_(bytes) {}

  /// Parses the textual form, upper or lower case.
  static std::optional<UUID> Parse(std::string_view text);

  explicit operator std::string() const;
  explicit operator Bytes() const { return bytes_; }

  friend bool operator==(UUID const &, UUID const &) = default;
  friend auto operator<=>(UUID const &, UUID const &) = default;

 private:
  Bytes bytes_;
};

}  // namespace trellis::utils

template <>
struct fmt::formatter<trellis::utils::UUID> : fmt::formatter<std::string> {
  auto format(trellis::utils::UUID const &uuid, format_context &ctx) const {
    return fmt::formatter<std::string>::format(static_cast<std::string>(uuid), ctx);
  }
};
