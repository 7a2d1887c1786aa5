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

#include <compare>
#include <cstddef>
#include <ostream>
#include <string>

#include "storage/error.hpp"

namespace trellis::storage {

/// Classification of vertices and edges. Types are at most 255 characters
/// long and can only contain letters, numbers, dashes and underscores.
class Type final {
 public:
  static constexpr size_t kMaxLength = 255;

  /// Validates `value` and returns a new type.
  ///
  /// @return `ValidationError::ValueTooLong` if the value is longer than
  ///         `kMaxLength`, `ValidationError::InvalidValue` if it is empty or
  ///         contains disallowed characters.
  static ValidationResult<Type> New(std::string value);

  const std::string &AsString() const { return value_; }

  friend bool operator==(const Type &, const Type &) = default;
  friend auto operator<=>(const Type &, const Type &) = default;

  friend std::ostream &operator<<(std::ostream &os, const Type &type) { return os << type.value_; }

 private:
  explicit Type(std::string value) : value_(std::move(value)) {}

  std::string value_;
};

/// Strength of a relationship, always within [-1.0, 1.0].
class Weight final {
 public:
  static constexpr float kMin = -1.0F;
  static constexpr float kMax = 1.0F;

  /// @return `ValidationError::InvalidValue` if `value` is NaN or outside of
  ///         [kMin, kMax].
  static ValidationResult<Weight> New(float value);

  float AsFloat() const { return value_; }

  friend bool operator==(const Weight &, const Weight &) = default;
  friend auto operator<=>(const Weight &, const Weight &) = default;

  friend std::ostream &operator<<(std::ostream &os, const Weight &weight) { return os << weight.value_; }

 private:
  explicit Weight(float value) : value_(value) {}

  float value_;
};

}  // namespace trellis::storage
