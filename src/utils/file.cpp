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

#include "utils/file.hpp"

#include <system_error>

namespace trellis::utils {

bool EnsureDir(const std::filesystem::path &dir) noexcept {
  std::error_code ec;
  auto const status = std::filesystem::status(dir, ec);
  if (std::filesystem::exists(status)) return std::filesystem::is_directory(status);
  std::filesystem::create_directories(dir, ec);
  return !ec && std::filesystem::is_directory(dir, ec);
}

}  // namespace trellis::utils
