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
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "storage/datastore.hpp"
#include "storage/edge.hpp"
#include "storage/error.hpp"
#include "storage/operation.hpp"
#include "storage/query.hpp"
#include "storage/vertex.hpp"
#include "utils/logging.hpp"
#include "utils/synchronized.hpp"

namespace trellis::storage {

/// Datastore kept entirely in memory. The whole graph is guarded by a single
/// reader-writer lock: reads share it, every write or transaction holds it
/// exclusively until it commits or rolls back.
template <Identifier Id>
class InMemoryDatastore final {
  struct EdgeValue {
    Weight weight;
    utils::Timestamp update_datetime;
  };

  // Orders edges by key and additionally allows lookups by outbound id alone.
  struct EdgeKeyLess {
    using is_transparent = void;
    bool operator()(const EdgeKey<Id> &a, const EdgeKey<Id> &b) const { return a < b; }
    bool operator()(const EdgeKey<Id> &a, const Id &b) const { return a.outbound_id < b; }
    bool operator()(const Id &a, const EdgeKey<Id> &b) const { return a < b.outbound_id; }
  };

  struct State {
    std::map<Id, Type> vertices;
    std::map<Type, std::set<Id>> vertices_by_type;
    std::map<EdgeKey<Id>, EdgeValue, EdgeKeyLess> edges;
    // inbound id -> (type, outbound id)
    std::map<Id, std::set<std::pair<Type, Id>>> inbound_edges;

    void PutVertex(const Id &id, const Type &type) {
      if (auto it = vertices.find(id); it != vertices.end()) EraseFromIndex(&vertices_by_type, it->second, id);
      vertices.insert_or_assign(id, type);
      vertices_by_type[type].insert(id);
    }

    void EraseVertex(const Id &id) {
      auto it = vertices.find(id);
      if (it == vertices.end()) return;
      EraseFromIndex(&vertices_by_type, it->second, id);
      vertices.erase(it);
    }

    void PutEdge(const EdgeKey<Id> &key, const EdgeValue &value) {
      edges.insert_or_assign(key, value);
      inbound_edges[key.inbound_id].emplace(key.type, key.outbound_id);
    }

    void EraseEdge(const EdgeKey<Id> &key) {
      if (edges.erase(key) == 0) return;
      EraseFromIndex(&inbound_edges, key.inbound_id, std::pair{key.type, key.outbound_id});
    }

   private:
    template <typename TIndex, typename TKey, typename TValue>
    static void EraseFromIndex(TIndex *index, const TKey &key, const TValue &value) {
      auto it = index->find(key);
      if (it == index->end()) return;
      it->second.erase(value);
      if (it->second.empty()) index->erase(it);
    }
  };

  using SynchronizedState = utils::Synchronized<State, std::shared_mutex>;

  static Edge<Id> MakeEdge(const EdgeKey<Id> &key, const EdgeValue &value) {
    return Edge<Id>(key, value.weight, value.update_datetime);
  }

  static std::vector<Vertex<Id>> ReadVertices(const State &state, const VertexQuery<Id> &query) {
    std::vector<Vertex<Id>> result;
    if (const auto *specific = std::get_if<SpecificVertexQuery<Id>>(&query)) {
      for (const auto &id : SortedUnique(specific->ids)) {
        if (auto it = state.vertices.find(id); it != state.vertices.end()) result.emplace_back(it->first, it->second);
      }
      return result;
    }

    const auto &range = std::get<RangeVertexQuery<Id>>(query);
    if (range.limit == 0) return result;
    result.reserve(std::min<size_t>(range.limit, 1024));
    if (range.type) {
      auto ids_it = state.vertices_by_type.find(*range.type);
      if (ids_it == state.vertices_by_type.end()) return result;
      const auto &ids = ids_it->second;
      for (auto it = range.start_id ? ids.upper_bound(*range.start_id) : ids.begin();
           it != ids.end() && result.size() < range.limit; ++it) {
        result.emplace_back(*it, *range.type);
      }
      return result;
    }
    for (auto it = range.start_id ? state.vertices.upper_bound(*range.start_id) : state.vertices.begin();
         it != state.vertices.end() && result.size() < range.limit; ++it) {
      result.emplace_back(it->first, it->second);
    }
    return result;
  }

  static std::vector<Edge<Id>> ReadEdges(const State &state, const EdgeQuery<Id> &query) {
    std::vector<Edge<Id>> result;
    if (const auto *specific = std::get_if<SpecificEdgeQuery<Id>>(&query)) {
      auto keys = specific->keys;
      std::sort(keys.begin(), keys.end());
      keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
      for (const auto &key : keys) {
        if (auto it = state.edges.find(key); it != state.edges.end()) result.push_back(MakeEdge(it->first, it->second));
      }
      return result;
    }

    const auto &filter = std::get<FilteredEdgeQuery<Id>>(query);
    if (filter.limit == 0) return result;

    if (!filter.outbound_id && filter.inbound_id) {
      auto inbound_it = state.inbound_edges.find(*filter.inbound_id);
      if (inbound_it == state.inbound_edges.end()) return result;
      for (const auto &[type, outbound_id] : inbound_it->second) {
        auto it = state.edges.find(EdgeKey<Id>{outbound_id, type, *filter.inbound_id});
        DTR_ASSERT(it != state.edges.end(), "Inbound edge index is out of sync");
        auto edge = MakeEdge(it->first, it->second);
        if (Matches(filter, edge)) result.push_back(std::move(edge));
      }
      std::sort(result.begin(), result.end(), [](const auto &a, const auto &b) { return a.key() < b.key(); });
      if (result.size() > filter.limit) {
        result.erase(result.begin() + static_cast<std::ptrdiff_t>(filter.limit), result.end());
      }
      return result;
    }

    auto [begin, end] = filter.outbound_id ? state.edges.equal_range(*filter.outbound_id)
                                           : std::pair{state.edges.begin(), state.edges.end()};
    for (auto it = begin; it != end && result.size() < filter.limit; ++it) {
      auto edge = MakeEdge(it->first, it->second);
      if (Matches(filter, edge)) result.push_back(std::move(edge));
    }
    return result;
  }

  static uint64_t CountEdges(const State &state, const Id &id, const std::optional<Type> &type,
                             EdgeDirection direction) {
    uint64_t count = 0;
    if (direction == EdgeDirection::Outbound) {
      auto [begin, end] = state.edges.equal_range(id);
      for (auto it = begin; it != end; ++it) {
        if (!type || it->first.type == *type) ++count;
      }
      return count;
    }
    auto inbound_it = state.inbound_edges.find(id);
    if (inbound_it == state.inbound_edges.end()) return 0;
    for (const auto &[edge_type, outbound_id] : inbound_it->second) {
      if (!type || edge_type == *type) ++count;
    }
    return count;
  }

 public:
  using IdType = Id;

  /// Exclusive access to the datastore for the duration of one transaction.
  /// Every change is recorded in an undo log which is replayed in reverse
  /// when the accessor is destroyed without being committed.
  class Accessor final {
   public:
    explicit Accessor(typename SynchronizedState::LockedPtr state) : state_(std::move(state)) {}

    Accessor(const Accessor &) = delete;
    Accessor &operator=(const Accessor &) = delete;
    Accessor(Accessor &&) = delete;
    Accessor &operator=(Accessor &&) = delete;

    ~Accessor() {
      if (!undo_log_.empty()) Rollback();
    }

    Result<bool> CreateVertex(const Vertex<Id> &vertex) {
      if (state_->vertices.contains(vertex.id())) return std::unexpected{Error::UuidTaken()};
      undo_log_.emplace_back(VertexUndo{vertex.id(), std::nullopt});
      state_->PutVertex(vertex.id(), vertex.type());
      return true;
    }

    Result<std::vector<Vertex<Id>>> GetVertices(const VertexQuery<Id> &query) { return ReadVertices(*state_, query); }

    Result<void> DeleteVertices(const VertexQuery<Id> &query) {
      for (const auto &vertex : ReadVertices(*state_, query)) {
        std::vector<EdgeKey<Id>> incident;
        auto [begin, end] = state_->edges.equal_range(vertex.id());
        for (auto it = begin; it != end; ++it) incident.push_back(it->first);
        if (auto it = state_->inbound_edges.find(vertex.id()); it != state_->inbound_edges.end()) {
          for (const auto &[type, outbound_id] : it->second) incident.push_back({outbound_id, type, vertex.id()});
        }
        for (const auto &key : incident) EraseEdge(key);
        undo_log_.emplace_back(VertexUndo{vertex.id(), vertex.type()});
        state_->EraseVertex(vertex.id());
      }
      return {};
    }

    Result<uint64_t> GetVertexCount() { return state_->vertices.size(); }

    Result<bool> CreateEdge(const Edge<Id> &edge) {
      if (!state_->vertices.contains(edge.outbound_id()) || !state_->vertices.contains(edge.inbound_id())) {
        return false;
      }
      std::optional<EdgeValue> previous;
      auto value = EdgeValue{edge.weight(), edge.update_datetime()};
      if (auto it = state_->edges.find(edge.key()); it != state_->edges.end()) {
        previous = it->second;
        value.update_datetime = std::max(value.update_datetime, previous->update_datetime);
      }
      undo_log_.emplace_back(EdgeUndo{edge.key(), previous});
      state_->PutEdge(edge.key(), value);
      return true;
    }

    Result<std::vector<Edge<Id>>> GetEdges(const EdgeQuery<Id> &query) { return ReadEdges(*state_, query); }

    Result<void> DeleteEdges(const EdgeQuery<Id> &query) {
      for (const auto &edge : ReadEdges(*state_, query)) EraseEdge(edge.key());
      return {};
    }

    Result<uint64_t> GetEdgeCount(const Id &id, const std::optional<Type> &type, EdgeDirection direction) {
      return CountEdges(*state_, id, type, direction);
    }

    /// Makes the changes permanent. The accessor must not be used afterwards.
    void Commit() { undo_log_.clear(); }

   private:
    struct VertexUndo {
      Id id;
      std::optional<Type> previous;
    };
    struct EdgeUndo {
      EdgeKey<Id> key;
      std::optional<EdgeValue> previous;
    };

    void EraseEdge(const EdgeKey<Id> &key) {
      auto it = state_->edges.find(key);
      if (it == state_->edges.end()) return;
      undo_log_.emplace_back(EdgeUndo{key, it->second});
      state_->EraseEdge(key);
    }

    void Rollback() {
      spdlog::trace("Rolling back {} in-memory changes", undo_log_.size());
      for (auto it = undo_log_.rbegin(); it != undo_log_.rend(); ++it) {
        std::visit(
            [this](const auto &undo) {
              using TUndo = std::decay_t<decltype(undo)>;
              if constexpr (std::is_same_v<TUndo, VertexUndo>) {
                if (undo.previous) {
                  state_->PutVertex(undo.id, *undo.previous);
                } else {
                  state_->EraseVertex(undo.id);
                }
              } else {
                if (undo.previous) {
                  state_->PutEdge(undo.key, *undo.previous);
                } else {
                  state_->EraseEdge(undo.key);
                }
              }
            },
            *it);
      }
      undo_log_.clear();
    }

    typename SynchronizedState::LockedPtr state_;
    std::vector<std::variant<VertexUndo, EdgeUndo>> undo_log_;
  };

  InMemoryDatastore() = default;

  /// Starts a transaction. Blocks until every other accessor is gone.
  Accessor Access() { return Accessor{state_.Lock()}; }

  Result<bool> CreateVertex(const Vertex<Id> &vertex) {
    return WithAccessor([&](Accessor &accessor) { return accessor.CreateVertex(vertex); });
  }

  Result<std::vector<Vertex<Id>>> GetVertices(const VertexQuery<Id> &query) {
    return state_.WithReadLock([&](const State &state) { return ReadVertices(state, query); });
  }

  Result<void> DeleteVertices(const VertexQuery<Id> &query) {
    return WithAccessor([&](Accessor &accessor) { return accessor.DeleteVertices(query); });
  }

  Result<uint64_t> GetVertexCount() {
    return state_.WithReadLock([](const State &state) -> uint64_t { return state.vertices.size(); });
  }

  Result<bool> CreateEdge(const Edge<Id> &edge) {
    return WithAccessor([&](Accessor &accessor) { return accessor.CreateEdge(edge); });
  }

  Result<std::vector<Edge<Id>>> GetEdges(const EdgeQuery<Id> &query) {
    return state_.WithReadLock([&](const State &state) { return ReadEdges(state, query); });
  }

  Result<void> DeleteEdges(const EdgeQuery<Id> &query) {
    return WithAccessor([&](Accessor &accessor) { return accessor.DeleteEdges(query); });
  }

  Result<uint64_t> GetEdgeCount(const Id &id, const std::optional<Type> &type, EdgeDirection direction) {
    return state_.WithReadLock([&](const State &state) { return CountEdges(state, id, type, direction); });
  }

  Result<std::vector<OperationResult<Id>>> Transaction(std::vector<Operation<Id>> operations) {
    return WithAccessor([&](Accessor &accessor) { return ApplyOperations<Id>(accessor, operations); });
  }

 private:
  template <typename TFunc>
  auto WithAccessor(TFunc &&func) {
    auto accessor = Access();
    auto result = func(accessor);
    if (result) accessor.Commit();
    return result;
  }

  SynchronizedState state_;
};

}  // namespace trellis::storage
