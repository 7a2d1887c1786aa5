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

#include "utils/logging.hpp"

#include <exception>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace trellis::logging {

void AssertFailed(std::source_location const loc, char const *expr, std::string const &message) {
  if (message.empty()) {
    spdlog::critical("Assertion '{}' failed at {}:{} in {}", expr, loc.file_name(), loc.line(), loc.function_name());
  } else {
    spdlog::critical("Assertion '{}' failed at {}:{} in {}: {}", expr, loc.file_name(), loc.line(),
                     loc.function_name(), message);
  }
  spdlog::default_logger()->flush();
  std::terminate();
}

void RedirectToStderr() { spdlog::set_default_logger(spdlog::stderr_color_mt("stderr")); }

}  // namespace trellis::logging
