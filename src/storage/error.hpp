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

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "utils/exceptions.hpp"

namespace trellis::storage {

/// Failures of the validating constructors of the value model. They never
/// reach a datastore, inputs are validated before a storage call is made.
enum class ValidationError : uint8_t {
  InvalidValue,
  ValueTooLong,
  CannotIncrementUuid,
};

std::string_view ValidationErrorToString(ValidationError error);

template <typename TValue>
using ValidationResult = std::expected<TValue, ValidationError>;

/// Kinds of failures a datastore operation can end with, regardless of the
/// backend that served it.
enum class ErrorKind : uint8_t {
  Serialization,
  BackendStorage,
  UuidTaken,
};

std::string_view ErrorKindToString(ErrorKind kind);
std::optional<ErrorKind> ErrorKindFromString(std::string_view kind);

/// Operational error. The message keeps the backend specific cause and is
/// informative only, callers branch on `kind`.
struct Error {
  ErrorKind kind;
  std::string message;

  static Error Serialization(std::string message) { return {ErrorKind::Serialization, std::move(message)}; }
  static Error BackendStorage(std::string message) { return {ErrorKind::BackendStorage, std::move(message)}; }
  static Error UuidTaken() { return {ErrorKind::UuidTaken, "UUID already taken"}; }
};

template <typename TValue>
using Result = std::expected<TValue, Error>;

/// Thrown while decoding malformed payloads (wire messages or stored values).
/// It never escapes a datastore, it is translated into
/// `ErrorKind::Serialization`.
class SerializationException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(SerializationException)
};

}  // namespace trellis::storage
