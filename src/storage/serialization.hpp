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
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "storage/edge.hpp"
#include "storage/error.hpp"
#include "storage/id.hpp"
#include "storage/operation.hpp"
#include "storage/query.hpp"
#include "storage/types.hpp"
#include "storage/vertex.hpp"
#include "utils/timestamp.hpp"

// JSON representation of the value model, queries, operations and results.
// `ToJson` never fails. The `...FromJson` functions validate everything they
// read and throw `SerializationException` on malformed input, so a decoded
// value always satisfies the invariants of its type.
namespace trellis::storage {

/// Returns `object[field]`.
/// @throw SerializationException if `object` isn't an object or lacks `field`.
const nlohmann::json &RequireField(const nlohmann::json &object, std::string_view field);
std::string RequireString(const nlohmann::json &object, std::string_view field);
uint32_t RequireUint32(const nlohmann::json &object, std::string_view field);
const nlohmann::json &RequireArray(const nlohmann::json &object, std::string_view field);

nlohmann::json ToJson(const Type &type);
Type TypeFromJson(const nlohmann::json &json);

nlohmann::json ToJson(Weight weight);
Weight WeightFromJson(const nlohmann::json &json);

/// Timestamps are sent as integer nanoseconds since the Unix epoch.
nlohmann::json ToJson(utils::Timestamp timestamp);
utils::Timestamp TimestampFromJson(const nlohmann::json &json);

nlohmann::json ToJson(EdgeDirection direction);
EdgeDirection EdgeDirectionFromJson(const nlohmann::json &json);

nlohmann::json ToJson(const Error &error);
Error ErrorFromJson(const nlohmann::json &json);

/// Optional values are encoded as the value itself or `null`.
template <typename T, typename TEncode>
nlohmann::json OptionalToJson(const std::optional<T> &value, TEncode &&encode) {
  if (!value) return nullptr;
  return encode(*value);
}

template <typename TDecode>
auto OptionalFromJson(const nlohmann::json &object, std::string_view field, TDecode &&decode)
    -> std::optional<decltype(decode(object))> {
  if (!object.is_object()) throw SerializationException("Expected an object");
  auto it = object.find(field);
  if (it == object.end() || it->is_null()) return std::nullopt;
  return decode(*it);
}

template <Identifier Id>
nlohmann::json ToJson(const Vertex<Id> &vertex) {
  return {{"id", IdTraits<Id>::ToJson(vertex.id())}, {"type", ToJson(vertex.type())}};
}

template <Identifier Id>
Vertex<Id> VertexFromJson(const nlohmann::json &json) {
  return {IdTraits<Id>::FromJson(RequireField(json, "id")), TypeFromJson(RequireField(json, "type"))};
}

template <Identifier Id>
nlohmann::json ToJson(const EdgeKey<Id> &key) {
  return {{"outbound_id", IdTraits<Id>::ToJson(key.outbound_id)},
          {"type", ToJson(key.type)},
          {"inbound_id", IdTraits<Id>::ToJson(key.inbound_id)}};
}

template <Identifier Id>
EdgeKey<Id> EdgeKeyFromJson(const nlohmann::json &json) {
  return {IdTraits<Id>::FromJson(RequireField(json, "outbound_id")), TypeFromJson(RequireField(json, "type")),
          IdTraits<Id>::FromJson(RequireField(json, "inbound_id"))};
}

template <Identifier Id>
nlohmann::json ToJson(const Edge<Id> &edge) {
  auto json = ToJson(edge.key());
  json["weight"] = ToJson(edge.weight());
  json["update_datetime"] = ToJson(edge.update_datetime());
  return json;
}

template <Identifier Id>
Edge<Id> EdgeFromJson(const nlohmann::json &json) {
  return {EdgeKeyFromJson<Id>(json), WeightFromJson(RequireField(json, "weight")),
          TimestampFromJson(RequireField(json, "update_datetime"))};
}

template <typename T>
nlohmann::json ToJson(const std::vector<T> &values) {
  auto json = nlohmann::json::array();
  for (const auto &value : values) json.push_back(ToJson(value));
  return json;
}

template <typename TDecode>
auto ArrayFromJson(const nlohmann::json &json, TDecode &&decode) -> std::vector<decltype(decode(json))> {
  if (!json.is_array()) throw SerializationException("Expected an array");
  std::vector<decltype(decode(json))> values;
  values.reserve(json.size());
  for (const auto &element : json) values.push_back(decode(element));
  return values;
}

template <Identifier Id>
nlohmann::json ToJson(const VertexQuery<Id> &query) {
  if (const auto *specific = std::get_if<SpecificVertexQuery<Id>>(&query)) {
    auto ids = nlohmann::json::array();
    for (const auto &id : specific->ids) ids.push_back(IdTraits<Id>::ToJson(id));
    return {{"kind", "specific"}, {"ids", std::move(ids)}};
  }
  const auto &range = std::get<RangeVertexQuery<Id>>(query);
  return {{"kind", "range"},
          {"limit", range.limit},
          {"type", OptionalToJson(range.type, [](const Type &type) { return ToJson(type); })},
          {"start_id", OptionalToJson(range.start_id, [](const Id &id) { return IdTraits<Id>::ToJson(id); })}};
}

template <Identifier Id>
VertexQuery<Id> VertexQueryFromJson(const nlohmann::json &json) {
  auto const kind = RequireString(json, "kind");
  if (kind == "specific") {
    return SpecificVertexQuery<Id>{
        ArrayFromJson(RequireArray(json, "ids"), [](const nlohmann::json &id) { return IdTraits<Id>::FromJson(id); })};
  }
  if (kind == "range") {
    return RangeVertexQuery<Id>{
        .limit = RequireUint32(json, "limit"),
        .type = OptionalFromJson(json, "type", [](const nlohmann::json &type) { return TypeFromJson(type); }),
        .start_id = OptionalFromJson(json, "start_id", [](const nlohmann::json &id) { return IdTraits<Id>::FromJson(id); }),
    };
  }
  throw SerializationException("Unknown vertex query kind '{}'", kind);
}

template <Identifier Id>
nlohmann::json ToJson(const EdgeQuery<Id> &query) {
  if (const auto *specific = std::get_if<SpecificEdgeQuery<Id>>(&query)) {
    return {{"kind", "specific"}, {"keys", ToJson(specific->keys)}};
  }
  const auto &filter = std::get<FilteredEdgeQuery<Id>>(query);
  auto encode_id = [](const Id &id) { return IdTraits<Id>::ToJson(id); };
  auto encode_float = [](float value) { return nlohmann::json(value); };
  auto encode_timestamp = [](utils::Timestamp timestamp) { return ToJson(timestamp); };
  return {{"kind", "filtered"},
          {"outbound_id", OptionalToJson(filter.outbound_id, encode_id)},
          {"type", OptionalToJson(filter.type, [](const Type &type) { return ToJson(type); })},
          {"inbound_id", OptionalToJson(filter.inbound_id, encode_id)},
          {"min_weight", OptionalToJson(filter.min_weight, encode_float)},
          {"max_weight", OptionalToJson(filter.max_weight, encode_float)},
          {"low", OptionalToJson(filter.low, encode_timestamp)},
          {"high", OptionalToJson(filter.high, encode_timestamp)},
          {"limit", filter.limit}};
}

template <Identifier Id>
EdgeQuery<Id> EdgeQueryFromJson(const nlohmann::json &json) {
  auto const kind = RequireString(json, "kind");
  if (kind == "specific") {
    return SpecificEdgeQuery<Id>{ArrayFromJson(RequireArray(json, "keys"), [](const nlohmann::json &key) {
      return EdgeKeyFromJson<Id>(key);
    })};
  }
  if (kind == "filtered") {
    auto decode_id = [](const nlohmann::json &id) { return IdTraits<Id>::FromJson(id); };
    auto decode_float = [](const nlohmann::json &value) {
      if (!value.is_number()) throw SerializationException("Expected a number");
      return value.get<float>();
    };
    return FilteredEdgeQuery<Id>{
        .outbound_id = OptionalFromJson(json, "outbound_id", decode_id),
        .type = OptionalFromJson(json, "type", [](const nlohmann::json &type) { return TypeFromJson(type); }),
        .inbound_id = OptionalFromJson(json, "inbound_id", decode_id),
        .min_weight = OptionalFromJson(json, "min_weight", decode_float),
        .max_weight = OptionalFromJson(json, "max_weight", decode_float),
        .low = OptionalFromJson(json, "low", [](const nlohmann::json &low) { return TimestampFromJson(low); }),
        .high = OptionalFromJson(json, "high", [](const nlohmann::json &high) { return TimestampFromJson(high); }),
        .limit = RequireUint32(json, "limit"),
    };
  }
  throw SerializationException("Unknown edge query kind '{}'", kind);
}

template <Identifier Id>
nlohmann::json ToJson(const Operation<Id> &operation) {
  return std::visit(
      [](const auto &op) {
        using TOp = std::decay_t<decltype(op)>;
        nlohmann::json json = {{"type", std::string(TOp::kType)}};
        if constexpr (std::is_same_v<TOp, CreateVertexOp<Id>>) {
          json["vertex"] = ToJson(op.vertex);
        } else if constexpr (std::is_same_v<TOp, CreateEdgeOp<Id>>) {
          json["edge"] = ToJson(op.edge);
        } else if constexpr (std::is_same_v<TOp, GetEdgeCountOp<Id>>) {
          json["id"] = IdTraits<Id>::ToJson(op.id);
          json["edge_type"] = OptionalToJson(op.type, [](const Type &type) { return ToJson(type); });
          json["direction"] = ToJson(op.direction);
        } else if constexpr (!std::is_same_v<TOp, GetVertexCountOp>) {
          json["query"] = ToJson(op.query);
        }
        return json;
      },
      operation);
}

template <Identifier Id>
Operation<Id> OperationFromJson(const nlohmann::json &json) {
  auto const type = RequireString(json, "type");
  if (type == CreateVertexOp<Id>::kType) return CreateVertexOp<Id>{VertexFromJson<Id>(RequireField(json, "vertex"))};
  if (type == GetVerticesOp<Id>::kType) return GetVerticesOp<Id>{VertexQueryFromJson<Id>(RequireField(json, "query"))};
  if (type == DeleteVerticesOp<Id>::kType) {
    return DeleteVerticesOp<Id>{VertexQueryFromJson<Id>(RequireField(json, "query"))};
  }
  if (type == GetVertexCountOp::kType) return GetVertexCountOp{};
  if (type == CreateEdgeOp<Id>::kType) return CreateEdgeOp<Id>{EdgeFromJson<Id>(RequireField(json, "edge"))};
  if (type == GetEdgesOp<Id>::kType) return GetEdgesOp<Id>{EdgeQueryFromJson<Id>(RequireField(json, "query"))};
  if (type == DeleteEdgesOp<Id>::kType) return DeleteEdgesOp<Id>{EdgeQueryFromJson<Id>(RequireField(json, "query"))};
  if (type == GetEdgeCountOp<Id>::kType) {
    return GetEdgeCountOp<Id>{
        .id = IdTraits<Id>::FromJson(RequireField(json, "id")),
        .type = OptionalFromJson(json, "edge_type", [](const nlohmann::json &edge_type) { return TypeFromJson(edge_type); }),
        .direction = EdgeDirectionFromJson(RequireField(json, "direction")),
    };
  }
  throw SerializationException("Unknown operation '{}'", type);
}

// Results are tagged with their kind because an empty vertex list and an
// empty edge list would otherwise be indistinguishable.
template <Identifier Id>
nlohmann::json ToJson(const OperationResult<Id> &result) {
  return std::visit(
      [](const auto &value) -> nlohmann::json {
        using TValue = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<TValue, bool>) {
          return {{"kind", "bool"}, {"value", value}};
        } else if constexpr (std::is_same_v<TValue, std::vector<Vertex<Id>>>) {
          return {{"kind", "vertices"}, {"value", ToJson(value)}};
        } else if constexpr (std::is_same_v<TValue, std::vector<Edge<Id>>>) {
          return {{"kind", "edges"}, {"value", ToJson(value)}};
        } else if constexpr (std::is_same_v<TValue, uint64_t>) {
          return {{"kind", "count"}, {"value", value}};
        } else {
          return {{"kind", "none"}};
        }
      },
      result);
}

template <Identifier Id>
OperationResult<Id> OperationResultFromJson(const nlohmann::json &json) {
  auto const kind = RequireString(json, "kind");
  if (kind == "none") return std::monostate{};
  const auto &value = RequireField(json, "value");
  if (kind == "bool") {
    if (!value.is_boolean()) throw SerializationException("Expected a boolean result");
    return value.get<bool>();
  }
  if (kind == "count") {
    if (!value.is_number_unsigned()) throw SerializationException("Expected a count result");
    return value.get<uint64_t>();
  }
  if (kind == "vertices") {
    return ArrayFromJson(value, [](const nlohmann::json &vertex) { return VertexFromJson<Id>(vertex); });
  }
  if (kind == "edges") {
    return ArrayFromJson(value, [](const nlohmann::json &edge) { return EdgeFromJson<Id>(edge); });
  }
  throw SerializationException("Unknown result kind '{}'", kind);
}

}  // namespace trellis::storage
