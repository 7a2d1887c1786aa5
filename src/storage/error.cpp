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

#include "storage/error.hpp"

namespace trellis::storage {

std::string_view ValidationErrorToString(ValidationError error) {
  switch (error) {
    case ValidationError::InvalidValue:
      return "invalid value";
    case ValidationError::ValueTooLong:
      return "value too long";
    case ValidationError::CannotIncrementUuid:
      return "could not increment the UUID";
  }
  return "unknown validation error";
}

std::string_view ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Serialization:
      return "serialization";
    case ErrorKind::BackendStorage:
      return "backend_storage";
    case ErrorKind::UuidTaken:
      return "uuid_taken";
  }
  return "unknown";
}

std::optional<ErrorKind> ErrorKindFromString(std::string_view kind) {
  if (kind == "serialization") return ErrorKind::Serialization;
  if (kind == "backend_storage") return ErrorKind::BackendStorage;
  if (kind == "uuid_taken") return ErrorKind::UuidTaken;
  return std::nullopt;
}

}  // namespace trellis::storage
