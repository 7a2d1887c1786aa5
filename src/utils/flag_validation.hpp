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

/// @file
///
/// gflags definitions with an attached validator. The validation body sees
/// the new value as `value` and the flag name as `flagname`:
///
/// @code
/// DEFINE_VALIDATED_uint64(workers, 4, "Worker threads.", FLAG_IN_RANGE(1, 1024));
/// @endcode
#pragma once

#include <cstdint>
#include <iostream>
#include <string>

#include "gflags/gflags.h"

#define DEFINE_VALIDATED_FLAG(flag_type, flag_name, default_value, description, cpp_type, validation_body) \
  DEFINE_##flag_type(flag_name, default_value, description);                                               \
  namespace {                                                                                              \
  bool validate_##flag_name(const char *flagname, cpp_type value) validation_body                          \
  }                                                                                                        \
  DEFINE_validator(flag_name, &validate_##flag_name)

#define DEFINE_VALIDATED_uint64(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(uint64, flag_name, default_value, description, std::uint64_t, validation_body)

#define DEFINE_VALIDATED_string(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(string, flag_name, default_value, description, const std::string &, validation_body)

/// Validation body accepting values in [lower_bound, upper_bound].
#define FLAG_IN_RANGE(lower_bound, upper_bound)                                                             \
  {                                                                                                         \
    if (value >= (lower_bound) && value <= (upper_bound)) return true;                                      \
    std::cout << "--" << flagname << " must be between " << (lower_bound) << " and " << (upper_bound) \
              << ", got " << value << std::endl;                                                            \
    return false;                                                                                           \
  }
