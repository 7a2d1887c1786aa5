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
#include <string_view>
#include <variant>
#include <vector>

#include "storage/edge.hpp"
#include "storage/query.hpp"
#include "storage/vertex.hpp"

namespace trellis::storage {

// Every operation of the datastore contract as a value. `kType` is the tag
// used on the wire.

template <Identifier Id>
struct CreateVertexOp {
  static constexpr std::string_view kType = "create_vertex";
  Vertex<Id> vertex;
};

template <Identifier Id>
struct GetVerticesOp {
  static constexpr std::string_view kType = "get_vertices";
  VertexQuery<Id> query;
};

template <Identifier Id>
struct DeleteVerticesOp {
  static constexpr std::string_view kType = "delete_vertices";
  VertexQuery<Id> query;
};

struct GetVertexCountOp {
  static constexpr std::string_view kType = "get_vertex_count";
};

template <Identifier Id>
struct CreateEdgeOp {
  static constexpr std::string_view kType = "create_edge";
  Edge<Id> edge;
};

template <Identifier Id>
struct GetEdgesOp {
  static constexpr std::string_view kType = "get_edges";
  EdgeQuery<Id> query;
};

template <Identifier Id>
struct DeleteEdgesOp {
  static constexpr std::string_view kType = "delete_edges";
  EdgeQuery<Id> query;
};

template <Identifier Id>
struct GetEdgeCountOp {
  static constexpr std::string_view kType = "get_edge_count";
  Id id;
  std::optional<Type> type;
  EdgeDirection direction;
};

template <Identifier Id>
using Operation = std::variant<CreateVertexOp<Id>, GetVerticesOp<Id>, DeleteVerticesOp<Id>, GetVertexCountOp,
                               CreateEdgeOp<Id>, GetEdgesOp<Id>, DeleteEdgesOp<Id>, GetEdgeCountOp<Id>>;

/// Success payload of one operation: `bool` for creations, the matching
/// elements for reads, a count for counts and `std::monostate` for deletions.
template <Identifier Id>
using OperationResult = std::variant<bool, std::vector<Vertex<Id>>, std::vector<Edge<Id>>, uint64_t, std::monostate>;

}  // namespace trellis::storage
