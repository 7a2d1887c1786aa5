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
#include <variant>
#include <vector>

#include "storage/edge.hpp"
#include "storage/id.hpp"
#include "storage/types.hpp"
#include "utils/timestamp.hpp"

namespace trellis::storage {

/// Selects vertices by their identifiers.
template <Identifier Id>
struct SpecificVertexQuery {
  std::vector<Id> ids;
};

/// Selects up to `limit` vertices ordered by identifier, starting after
/// `start_id` (exclusive) and optionally restricted to one type.
template <Identifier Id>
struct RangeVertexQuery {
  uint32_t limit;
  std::optional<Type> type;
  std::optional<Id> start_id;
};

template <Identifier Id>
using VertexQuery = std::variant<SpecificVertexQuery<Id>, RangeVertexQuery<Id>>;

/// Selects edges by their keys.
template <Identifier Id>
struct SpecificEdgeQuery {
  std::vector<EdgeKey<Id>> keys;
};

/// Selects up to `limit` edges matching every set filter. Weight and datetime
/// bounds are inclusive.
template <Identifier Id>
struct FilteredEdgeQuery {
  std::optional<Id> outbound_id;
  std::optional<Type> type;
  std::optional<Id> inbound_id;
  std::optional<float> min_weight;
  std::optional<float> max_weight;
  std::optional<utils::Timestamp> low;
  std::optional<utils::Timestamp> high;
  uint32_t limit;
};

template <Identifier Id>
using EdgeQuery = std::variant<SpecificEdgeQuery<Id>, FilteredEdgeQuery<Id>>;

enum class EdgeDirection : uint8_t { Outbound, Inbound };

/// Returns true if `edge` passes every filter of `query` that is set.
template <Identifier Id>
bool Matches(const FilteredEdgeQuery<Id> &query, const Edge<Id> &edge) {
  if (query.outbound_id && *query.outbound_id != edge.outbound_id()) return false;
  if (query.type && *query.type != edge.type()) return false;
  if (query.inbound_id && *query.inbound_id != edge.inbound_id()) return false;
  auto const weight = edge.weight().AsFloat();
  if (query.min_weight && weight < *query.min_weight) return false;
  if (query.max_weight && weight > *query.max_weight) return false;
  if (query.low && edge.update_datetime() < *query.low) return false;
  if (query.high && edge.update_datetime() > *query.high) return false;
  return true;
}

}  // namespace trellis::storage
