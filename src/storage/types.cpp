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

#include "storage/types.hpp"

#include <regex>

namespace trellis::storage {

namespace {
const std::regex kTypeValidator{"^[a-zA-Z0-9_-]+$", std::regex_constants::optimize};
}  // namespace

ValidationResult<Type> Type::New(std::string value) {
  if (value.size() > kMaxLength) return std::unexpected{ValidationError::ValueTooLong};
  if (!std::regex_match(value, kTypeValidator)) return std::unexpected{ValidationError::InvalidValue};
  return Type{std::move(value)};
}

ValidationResult<Weight> Weight::New(float value) {
  if (!(value >= kMin && value <= kMax)) return std::unexpected{ValidationError::InvalidValue};
  return Weight{value};
}

}  // namespace trellis::storage
