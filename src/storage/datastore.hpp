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

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "storage/edge.hpp"
#include "storage/error.hpp"
#include "storage/operation.hpp"
#include "storage/query.hpp"
#include "storage/vertex.hpp"

namespace trellis::storage {

/// Capability contract shared by every backend. Local backends, the remote
/// client and the server generic code are all written against it.
template <typename T>
concept Datastore =
    Identifier<typename T::IdType> &&
    requires(T &datastore, const Vertex<typename T::IdType> &vertex, const Edge<typename T::IdType> &edge,
             const VertexQuery<typename T::IdType> &vertex_query, const EdgeQuery<typename T::IdType> &edge_query,
             const typename T::IdType &id, const std::optional<Type> &type, EdgeDirection direction,
             std::vector<Operation<typename T::IdType>> operations) {
      { datastore.CreateVertex(vertex) } -> std::same_as<Result<bool>>;
      { datastore.GetVertices(vertex_query) } -> std::same_as<Result<std::vector<Vertex<typename T::IdType>>>>;
      { datastore.DeleteVertices(vertex_query) } -> std::same_as<Result<void>>;
      { datastore.GetVertexCount() } -> std::same_as<Result<uint64_t>>;
      { datastore.CreateEdge(edge) } -> std::same_as<Result<bool>>;
      { datastore.GetEdges(edge_query) } -> std::same_as<Result<std::vector<Edge<typename T::IdType>>>>;
      { datastore.DeleteEdges(edge_query) } -> std::same_as<Result<void>>;
      { datastore.GetEdgeCount(id, type, direction) } -> std::same_as<Result<uint64_t>>;
      {
        datastore.Transaction(std::move(operations))
      } -> std::same_as<Result<std::vector<OperationResult<typename T::IdType>>>>;
    };

/// Runs a single operation against anything offering the eight single
/// operations of the contract (a datastore or a backend accessor).
template <Identifier Id, typename TTarget>
Result<OperationResult<Id>> ApplyOperation(TTarget &target, const Operation<Id> &operation) {
  using TResult = Result<OperationResult<Id>>;
  auto wrap = [](auto &&result) -> TResult {
    using TValue = typename std::remove_cvref_t<decltype(result)>::value_type;
    if (!result) return std::unexpected{std::move(result.error())};
    if constexpr (std::is_void_v<TValue>) {
      return OperationResult<Id>{std::monostate{}};
    } else {
      return OperationResult<Id>{std::in_place_type<TValue>, std::move(*result)};
    }
  };
  return std::visit(
      [&](const auto &op) -> TResult {
        using TOp = std::remove_cvref_t<decltype(op)>;
        if constexpr (std::is_same_v<TOp, CreateVertexOp<Id>>) {
          return wrap(target.CreateVertex(op.vertex));
        } else if constexpr (std::is_same_v<TOp, GetVerticesOp<Id>>) {
          return wrap(target.GetVertices(op.query));
        } else if constexpr (std::is_same_v<TOp, DeleteVerticesOp<Id>>) {
          return wrap(target.DeleteVertices(op.query));
        } else if constexpr (std::is_same_v<TOp, GetVertexCountOp>) {
          return wrap(target.GetVertexCount());
        } else if constexpr (std::is_same_v<TOp, CreateEdgeOp<Id>>) {
          return wrap(target.CreateEdge(op.edge));
        } else if constexpr (std::is_same_v<TOp, GetEdgesOp<Id>>) {
          return wrap(target.GetEdges(op.query));
        } else if constexpr (std::is_same_v<TOp, DeleteEdgesOp<Id>>) {
          return wrap(target.DeleteEdges(op.query));
        } else {
          static_assert(std::is_same_v<TOp, GetEdgeCountOp<Id>>, "Unhandled operation");
          return wrap(target.GetEdgeCount(op.id, op.type, op.direction));
        }
      },
      operation);
}

/// Applies `operations` in order through `accessor` and stops at the first
/// failure. The caller commits the accessor only when every operation
/// succeeded.
template <Identifier Id, typename TAccessor>
Result<std::vector<OperationResult<Id>>> ApplyOperations(TAccessor &accessor,
                                                         const std::vector<Operation<Id>> &operations) {
  std::vector<OperationResult<Id>> results;
  results.reserve(operations.size());
  for (const auto &operation : operations) {
    auto result = ApplyOperation<Id>(accessor, operation);
    if (!result) return std::unexpected{std::move(result.error())};
    results.push_back(std::move(*result));
  }
  return results;
}

/// Orders `ids` ascending and drops duplicates.
template <Identifier Id>
std::vector<Id> SortedUnique(std::vector<Id> ids) {
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return ids;
}

}  // namespace trellis::storage
