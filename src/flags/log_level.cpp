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

#include "flags/log_level.hpp"

#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

#include "fmt/ranges.h"
#include "gflags/gflags.h"
#include "spdlog/common.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace std::string_view_literals;

DEFINE_bool(also_log_to_stderr, false, "Log messages go to stderr in addition to the log file");
DEFINE_string(log_file, "", "Path to where the log should be stored.");

namespace {

inline constexpr std::array log_level_mappings{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

std::string AllowedLogLevels() {
  std::vector<std::string_view> names;
  names.reserve(log_level_mappings.size());
  for (const auto &[name, _] : log_level_mappings) names.push_back(name);
  return fmt::format("{}", fmt::join(names, ", "));
}

const std::string log_level_help_string = fmt::format("Minimum log level. Allowed values: {}", AllowedLogLevels());

}  // namespace

DEFINE_VALIDATED_string(log_level, "WARNING", log_level_help_string.c_str(),
                        { return trellis::flags::ValidLogLevel(value); });

bool trellis::flags::ValidLogLevel(std::string_view value) {
  if (value.empty()) {
    std::cout << "Log level cannot be empty." << std::endl;
    return false;
  }
  if (!LogLevelToEnum(value)) {
    std::cout << "Invalid value for log level. Allowed values: " << AllowedLogLevels() << std::endl;
    return false;
  }
  return true;
}

std::optional<spdlog::level::level_enum> trellis::flags::LogLevelToEnum(std::string_view value) {
  auto const it = std::ranges::find_if(log_level_mappings, [&](const auto &mapping) {
    return std::ranges::equal(mapping.first, value,
                              [](char lhs, char rhs) { return std::toupper(lhs) == std::toupper(rhs); });
  });
  if (it == log_level_mappings.end()) return std::nullopt;
  return it->second;
}

namespace {

spdlog::level::level_enum ParseLogLevel() {
  const auto log_level = trellis::flags::LogLevelToEnum(FLAGS_log_level);
  TR_ASSERT(log_level, "Invalid log level");
  return *log_level;
}

}  // namespace

void trellis::flags::InitializeLogger() {
  std::vector<spdlog::sink_ptr> sinks;

  // The stderr sink is always first, `LogToStderr` relies on it.
  sinks.emplace_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  const bool log_to_file = !FLAGS_log_file.empty();
  sinks.back()->set_level(log_to_file && !FLAGS_also_log_to_stderr ? spdlog::level::off : spdlog::level::trace);

  if (log_to_file) {
    sinks.emplace_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(FLAGS_log_file));
  }

  auto logger = std::make_shared<spdlog::logger>("trellis_log", sinks.begin(), sinks.end());
  logger->set_level(ParseLogLevel());
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

void trellis::flags::LogToStderr(spdlog::level::level_enum log_level) {
  auto default_logger = spdlog::default_logger();
  auto sink = default_logger->sinks().front();
  sink->set_level(log_level);
}
