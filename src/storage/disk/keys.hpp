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

#include <bit>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "storage/edge.hpp"
#include "storage/error.hpp"
#include "storage/id.hpp"
#include "storage/types.hpp"
#include "utils/timestamp.hpp"

// Layout of the graph in the key-value store. Every key starts with a one
// byte prefix naming the record kind. Identifiers use the order preserving
// encoding of `IdTraits`, types are stored verbatim and terminated by a zero
// byte, so keys of one kind iterate in the same order as the in-memory
// backend.
//
//   v <id>                      -> type
//   t <type> <id>               -> (empty)
//   e <out> <type> <in>         -> weight (4 bytes) update datetime (8 bytes)
//   r <in> <type> <out>         -> (empty)
//   y <type> <out> <in>         -> (empty)
namespace trellis::storage::disk {

inline constexpr char kVertexPrefix = 'v';
inline constexpr char kVertexTypePrefix = 't';
inline constexpr char kEdgePrefix = 'e';
inline constexpr char kReversedEdgePrefix = 'r';
inline constexpr char kEdgeTypePrefix = 'y';

inline constexpr size_t kEdgeValueSize = sizeof(uint32_t) + sizeof(uint64_t);

inline void EncodeType(const Type &type, std::string *out) {
  out->append(type.AsString());
  out->push_back('\0');
}

inline Type DecodeType(std::string_view *in) {
  auto const end = in->find('\0');
  if (end == std::string_view::npos) throw SerializationException("Unterminated type in stored key");
  auto type = Type::New(std::string(in->substr(0, end)));
  if (!type) throw SerializationException("Invalid type in stored key: {}", ValidationErrorToString(type.error()));
  in->remove_prefix(end + 1);
  return *std::move(type);
}

template <Identifier Id>
Id DecodeId(std::string_view *in) {
  auto id = IdTraits<Id>::Decode(in);
  if (!id) throw SerializationException("Invalid identifier in stored key");
  return *std::move(id);
}

template <Identifier Id>
std::string VertexKey(const Id &id) {
  std::string key(1, kVertexPrefix);
  IdTraits<Id>::Encode(id, &key);
  return key;
}

inline std::string VertexTypePrefix(const Type &type) {
  std::string key(1, kVertexTypePrefix);
  EncodeType(type, &key);
  return key;
}

template <Identifier Id>
std::string VertexTypeKey(const Type &type, const Id &id) {
  auto key = VertexTypePrefix(type);
  IdTraits<Id>::Encode(id, &key);
  return key;
}

/// Prefix of every outbound edge of `outbound_id`, optionally of one type.
template <Identifier Id>
std::string EdgePrefix(const Id &outbound_id, const std::optional<Type> &type = std::nullopt) {
  std::string key(1, kEdgePrefix);
  IdTraits<Id>::Encode(outbound_id, &key);
  if (type) EncodeType(*type, &key);
  return key;
}

template <Identifier Id>
std::string EdgeKeyBytes(const EdgeKey<Id> &edge_key) {
  auto key = EdgePrefix(edge_key.outbound_id, edge_key.type);
  IdTraits<Id>::Encode(edge_key.inbound_id, &key);
  return key;
}

/// Prefix of every inbound edge of `inbound_id`, optionally of one type.
template <Identifier Id>
std::string ReversedEdgePrefix(const Id &inbound_id, const std::optional<Type> &type = std::nullopt) {
  std::string key(1, kReversedEdgePrefix);
  IdTraits<Id>::Encode(inbound_id, &key);
  if (type) EncodeType(*type, &key);
  return key;
}

template <Identifier Id>
std::string ReversedEdgeKeyBytes(const EdgeKey<Id> &edge_key) {
  auto key = ReversedEdgePrefix(edge_key.inbound_id, edge_key.type);
  IdTraits<Id>::Encode(edge_key.outbound_id, &key);
  return key;
}

inline std::string EdgeTypePrefix(const Type &type) {
  std::string key(1, kEdgeTypePrefix);
  EncodeType(type, &key);
  return key;
}

template <Identifier Id>
std::string EdgeTypeKeyBytes(const EdgeKey<Id> &edge_key) {
  auto key = EdgeTypePrefix(edge_key.type);
  IdTraits<Id>::Encode(edge_key.outbound_id, &key);
  IdTraits<Id>::Encode(edge_key.inbound_id, &key);
  return key;
}

/// Identifier stored after a fixed `prefix_size` bytes of a vertex or vertex
/// type key.
template <Identifier Id>
Id DecodeIdAfter(std::string_view key, size_t prefix_size) {
  key.remove_prefix(prefix_size);
  auto id = DecodeId<Id>(&key);
  if (!key.empty()) throw SerializationException("Trailing bytes in stored key");
  return id;
}

template <Identifier Id>
EdgeKey<Id> DecodeEdgeKey(std::string_view key) {
  if (key.empty() || key.front() != kEdgePrefix) throw SerializationException("Not an edge key");
  key.remove_prefix(1);
  auto outbound_id = DecodeId<Id>(&key);
  auto type = DecodeType(&key);
  auto inbound_id = DecodeId<Id>(&key);
  if (!key.empty()) throw SerializationException("Trailing bytes in stored edge key");
  return {std::move(outbound_id), std::move(type), std::move(inbound_id)};
}

template <Identifier Id>
EdgeKey<Id> DecodeReversedEdgeKey(std::string_view key) {
  if (key.empty() || key.front() != kReversedEdgePrefix) throw SerializationException("Not a reversed edge key");
  key.remove_prefix(1);
  auto inbound_id = DecodeId<Id>(&key);
  auto type = DecodeType(&key);
  auto outbound_id = DecodeId<Id>(&key);
  if (!key.empty()) throw SerializationException("Trailing bytes in stored reversed edge key");
  return {std::move(outbound_id), std::move(type), std::move(inbound_id)};
}

template <Identifier Id>
EdgeKey<Id> DecodeEdgeTypeKey(std::string_view key) {
  if (key.empty() || key.front() != kEdgeTypePrefix) throw SerializationException("Not an edge type key");
  key.remove_prefix(1);
  auto type = DecodeType(&key);
  auto outbound_id = DecodeId<Id>(&key);
  auto inbound_id = DecodeId<Id>(&key);
  if (!key.empty()) throw SerializationException("Trailing bytes in stored edge type key");
  return {std::move(outbound_id), std::move(type), std::move(inbound_id)};
}

inline std::string EncodeEdgeValue(Weight weight, utils::Timestamp update_datetime) {
  std::string value;
  value.reserve(kEdgeValueSize);
  auto const weight_bits = std::bit_cast<uint32_t>(weight.AsFloat());
  for (int shift = 24; shift >= 0; shift -= 8) value.push_back(static_cast<char>((weight_bits >> shift) & 0xFF));
  auto const datetime_bits = static_cast<uint64_t>(update_datetime.NanoSecSinceTheEpoch());
  for (int shift = 56; shift >= 0; shift -= 8) value.push_back(static_cast<char>((datetime_bits >> shift) & 0xFF));
  return value;
}

inline std::pair<Weight, utils::Timestamp> DecodeEdgeValue(std::string_view value) {
  if (value.size() != kEdgeValueSize) throw SerializationException("Stored edge value has {} bytes", value.size());
  uint32_t weight_bits = 0;
  for (size_t i = 0; i < sizeof(uint32_t); ++i) weight_bits = (weight_bits << 8) | static_cast<uint8_t>(value[i]);
  uint64_t datetime_bits = 0;
  for (size_t i = sizeof(uint32_t); i < kEdgeValueSize; ++i) {
    datetime_bits = (datetime_bits << 8) | static_cast<uint8_t>(value[i]);
  }
  auto weight = Weight::New(std::bit_cast<float>(weight_bits));
  if (!weight) throw SerializationException("Stored edge weight is out of range");
  return {*weight, utils::Timestamp(static_cast<int64_t>(datetime_bits))};
}

}  // namespace trellis::storage::disk
