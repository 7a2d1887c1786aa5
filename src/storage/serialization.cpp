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

#include "storage/serialization.hpp"

#include <limits>

namespace trellis::storage {

const nlohmann::json &RequireField(const nlohmann::json &object, std::string_view field) {
  if (!object.is_object()) throw SerializationException("Expected an object with field '{}'", field);
  auto it = object.find(field);
  if (it == object.end()) throw SerializationException("Missing field '{}'", field);
  return *it;
}

std::string RequireString(const nlohmann::json &object, std::string_view field) {
  const auto &value = RequireField(object, field);
  if (!value.is_string()) throw SerializationException("Field '{}' must be a string", field);
  return value.get<std::string>();
}

uint32_t RequireUint32(const nlohmann::json &object, std::string_view field) {
  const auto &value = RequireField(object, field);
  if (!value.is_number_unsigned() || value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
    throw SerializationException("Field '{}' must be an unsigned 32-bit integer", field);
  }
  return value.get<uint32_t>();
}

const nlohmann::json &RequireArray(const nlohmann::json &object, std::string_view field) {
  const auto &value = RequireField(object, field);
  if (!value.is_array()) throw SerializationException("Field '{}' must be an array", field);
  return value;
}

nlohmann::json ToJson(const Type &type) { return type.AsString(); }

Type TypeFromJson(const nlohmann::json &json) {
  if (!json.is_string()) throw SerializationException("Expected a type string");
  auto type = Type::New(json.get<std::string>());
  if (!type) throw SerializationException("Invalid type: {}", ValidationErrorToString(type.error()));
  return *std::move(type);
}

nlohmann::json ToJson(Weight weight) { return weight.AsFloat(); }

Weight WeightFromJson(const nlohmann::json &json) {
  if (!json.is_number()) throw SerializationException("Expected a numeric weight");
  auto weight = Weight::New(json.get<float>());
  if (!weight) throw SerializationException("Invalid weight: {}", ValidationErrorToString(weight.error()));
  return *weight;
}

nlohmann::json ToJson(utils::Timestamp timestamp) { return timestamp.NanoSecSinceTheEpoch(); }

utils::Timestamp TimestampFromJson(const nlohmann::json &json) {
  if (json.is_number_unsigned()) {
    if (json.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw SerializationException("Timestamp is out of range");
    }
    return utils::Timestamp(static_cast<int64_t>(json.get<uint64_t>()));
  }
  if (!json.is_number_integer()) throw SerializationException("Expected an integer timestamp");
  return utils::Timestamp(json.get<int64_t>());
}

nlohmann::json ToJson(EdgeDirection direction) {
  return direction == EdgeDirection::Outbound ? "outbound" : "inbound";
}

EdgeDirection EdgeDirectionFromJson(const nlohmann::json &json) {
  if (json == "outbound") return EdgeDirection::Outbound;
  if (json == "inbound") return EdgeDirection::Inbound;
  throw SerializationException("Invalid edge direction");
}

nlohmann::json ToJson(const Error &error) {
  return {{"kind", std::string(ErrorKindToString(error.kind))}, {"message", error.message}};
}

Error ErrorFromJson(const nlohmann::json &json) {
  auto kind = ErrorKindFromString(RequireString(json, "kind"));
  if (!kind) throw SerializationException("Unknown error kind");
  return {*kind, RequireString(json, "message")};
}

}  // namespace trellis::storage
