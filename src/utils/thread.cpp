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

#include "utils/thread.hpp"

#include <sys/prctl.h>

#include <string>

#include <spdlog/spdlog.h>

namespace trellis::utils {

void ThreadSetName(std::string_view name) {
  std::string const truncated{name.substr(0, kMaxThreadNameLength)};
  if (prctl(PR_SET_NAME, truncated.c_str()) != 0) {
    spdlog::warn("Couldn't set the thread name to {}", truncated);
  }
}

}  // namespace trellis::utils
