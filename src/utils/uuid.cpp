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

#include "utils/uuid.hpp"

namespace trellis::utils {

std::optional<UUID> UUID::Parse(std::string_view text) {
  if (text.size() != kStringLength) return std::nullopt;
  std::array<char, kStringLength + 1> terminated{};
  text.copy(terminated.data(), kStringLength);
  Bytes bytes{};
  if (uuid_parse(terminated.data(), bytes.data()) != 0) return std::nullopt;
  return UUID{bytes};
}

UUID::operator std::string() const {
  std::array<char, kStringLength + 1> text{};
  uuid_unparse_lower(bytes_.data(), text.data());
  return std::string{text.data(), kStringLength};
}

}  // namespace trellis::utils
