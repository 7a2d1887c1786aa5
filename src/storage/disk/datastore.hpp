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
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "kvstore/kvstore.hpp"
#include "storage/datastore.hpp"
#include "storage/disk/keys.hpp"
#include "storage/edge.hpp"
#include "storage/error.hpp"
#include "storage/operation.hpp"
#include "storage/query.hpp"
#include "storage/vertex.hpp"

namespace trellis::storage {

/// Datastore persisted in RocksDB. Every operation, and every batch passed
/// to `Transaction`, runs inside one pessimistic RocksDB transaction and
/// becomes visible atomically on commit.
template <Identifier Id>
class RocksdbDatastore final {
  // Runs `func` and turns the exceptions of the storage layer into errors.
  template <typename TFunc>
  static auto Guarded(TFunc &&func) -> decltype(func()) {
    try {
      return func();
    } catch (const kvstore::KVStoreError &e) {
      return std::unexpected{Error::BackendStorage(e.what())};
    } catch (const SerializationException &e) {
      return std::unexpected{Error::Serialization(e.what())};
    }
  }

 public:
  using IdType = Id;

  /// One RocksDB transaction. Destroying an accessor without committing it
  /// discards its writes.
  class Accessor final {
   public:
    explicit Accessor(kvstore::KVStore::Transaction txn) : txn_(std::move(txn)) {}

    Result<bool> CreateVertex(const Vertex<Id> &vertex) {
      return Guarded([&]() -> Result<bool> {
        auto const key = disk::VertexKey(vertex.id());
        if (txn_.GetForUpdate(key)) return std::unexpected{Error::UuidTaken()};
        txn_.Put(key, vertex.type().AsString());
        txn_.Put(disk::VertexTypeKey(vertex.type(), vertex.id()), "");
        return true;
      });
    }

    Result<std::vector<Vertex<Id>>> GetVertices(const VertexQuery<Id> &query) {
      return Guarded([&]() -> Result<std::vector<Vertex<Id>>> { return ReadVertices(query); });
    }

    Result<void> DeleteVertices(const VertexQuery<Id> &query) {
      return Guarded([&]() -> Result<void> {
        // Vertices come back in ascending key order, so concurrent deletes
        // lock them in the same order.
        for (const auto &vertex : ReadVertices(query)) {
          // Locking the vertex first waits out any CreateEdge holding it and
          // makes later ones see the vertex gone.
          auto const vertex_key = disk::VertexKey(vertex.id());
          auto stored = txn_.GetForUpdate(vertex_key);
          if (!stored) continue;
          std::vector<EdgeKey<Id>> incident;
          txn_.Scan(disk::EdgePrefix(vertex.id()), {}, [&](std::string_view key, std::string_view) {
            incident.push_back(disk::DecodeEdgeKey<Id>(key));
            return true;
          });
          txn_.Scan(disk::ReversedEdgePrefix(vertex.id()), {}, [&](std::string_view key, std::string_view) {
            incident.push_back(disk::DecodeReversedEdgeKey<Id>(key));
            return true;
          });
          for (const auto &edge_key : incident) DeleteEdge(edge_key);
          txn_.Delete(vertex_key);
          txn_.Delete(disk::VertexTypeKey(DecodeStoredType(*stored), vertex.id()));
        }
        return {};
      });
    }

    Result<uint64_t> GetVertexCount() {
      return Guarded([&]() -> Result<uint64_t> { return Count(std::string(1, disk::kVertexPrefix)); });
    }

    Result<bool> CreateEdge(const Edge<Id> &edge) {
      return Guarded([&]() -> Result<bool> {
        // Endpoints are locked in key order so edges created in opposite
        // directions can't deadlock.
        auto first = disk::VertexKey(edge.outbound_id());
        auto second = disk::VertexKey(edge.inbound_id());
        if (second < first) std::swap(first, second);
        if (!txn_.GetForUpdate(first)) return false;
        if (second != first && !txn_.GetForUpdate(second)) return false;
        auto const key = disk::EdgeKeyBytes(edge.key());
        auto update_datetime = edge.update_datetime();
        if (auto stored = txn_.GetForUpdate(key)) {
          update_datetime = std::max(update_datetime, disk::DecodeEdgeValue(*stored).second);
        }
        txn_.Put(key, disk::EncodeEdgeValue(edge.weight(), update_datetime));
        txn_.Put(disk::ReversedEdgeKeyBytes(edge.key()), "");
        txn_.Put(disk::EdgeTypeKeyBytes(edge.key()), "");
        return true;
      });
    }

    Result<std::vector<Edge<Id>>> GetEdges(const EdgeQuery<Id> &query) {
      return Guarded([&]() -> Result<std::vector<Edge<Id>>> { return ReadEdges(query); });
    }

    Result<void> DeleteEdges(const EdgeQuery<Id> &query) {
      return Guarded([&]() -> Result<void> {
        for (const auto &edge : ReadEdges(query)) DeleteEdge(edge.key());
        return {};
      });
    }

    Result<uint64_t> GetEdgeCount(const Id &id, const std::optional<Type> &type, EdgeDirection direction) {
      return Guarded([&]() -> Result<uint64_t> {
        return Count(direction == EdgeDirection::Outbound ? disk::EdgePrefix(id, type)
                                                          : disk::ReversedEdgePrefix(id, type));
      });
    }

    /// @throw kvstore::KVStoreError if RocksDB refuses the commit.
    void Commit() { txn_.Commit(); }

   private:
    std::vector<Vertex<Id>> ReadVertices(const VertexQuery<Id> &query) {
      std::vector<Vertex<Id>> result;
      if (const auto *specific = std::get_if<SpecificVertexQuery<Id>>(&query)) {
        for (const auto &id : SortedUnique(specific->ids)) {
          if (auto value = txn_.Get(disk::VertexKey(id))) result.emplace_back(id, DecodeStoredType(*value));
        }
        return result;
      }

      const auto &range = std::get<RangeVertexQuery<Id>>(query);
      if (range.limit == 0) return result;
      std::optional<Id> first;
      if (range.start_id) {
        auto next = IdTraits<Id>::Next(*range.start_id);
        if (!next) return result;
        first = *std::move(next);
      }

      if (range.type) {
        auto const prefix = disk::VertexTypePrefix(*range.type);
        auto const seek = first ? disk::VertexTypeKey(*range.type, *first) : prefix;
        txn_.Scan(prefix, seek, [&](std::string_view key, std::string_view) {
          result.emplace_back(disk::DecodeIdAfter<Id>(key, prefix.size()), *range.type);
          return result.size() < range.limit;
        });
        return result;
      }

      auto const prefix = std::string(1, disk::kVertexPrefix);
      auto const seek = first ? disk::VertexKey(*first) : prefix;
      txn_.Scan(prefix, seek, [&](std::string_view key, std::string_view value) {
        result.emplace_back(disk::DecodeIdAfter<Id>(key, prefix.size()), DecodeStoredType(value));
        return result.size() < range.limit;
      });
      return result;
    }

    std::vector<Edge<Id>> ReadEdges(const EdgeQuery<Id> &query) {
      std::vector<Edge<Id>> result;
      if (const auto *specific = std::get_if<SpecificEdgeQuery<Id>>(&query)) {
        auto keys = specific->keys;
        std::sort(keys.begin(), keys.end());
        keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
        for (const auto &key : keys) {
          if (auto edge = ReadEdge(key)) result.push_back(*std::move(edge));
        }
        return result;
      }

      const auto &filter = std::get<FilteredEdgeQuery<Id>>(query);
      if (filter.limit == 0) return result;

      auto collect = [&](const Edge<Id> &edge) {
        if (Matches(filter, edge)) result.push_back(edge);
        return result.size() < filter.limit;
      };

      if (filter.outbound_id) {
        txn_.Scan(disk::EdgePrefix(*filter.outbound_id, filter.type), {},
                  [&](std::string_view key, std::string_view value) {
                    auto [weight, update_datetime] = disk::DecodeEdgeValue(value);
                    return collect(Edge<Id>(disk::DecodeEdgeKey<Id>(key), weight, update_datetime));
                  });
        return result;
      }

      if (filter.inbound_id) {
        // Reversed keys are not in edge key order, so every match is collected
        // before ordering and truncating.
        txn_.Scan(disk::ReversedEdgePrefix(*filter.inbound_id, filter.type), {},
                  [&](std::string_view key, std::string_view) {
                    auto edge = ReadEdge(disk::DecodeReversedEdgeKey<Id>(key));
                    if (!edge) throw SerializationException("Reversed edge index points to a missing edge");
                    if (Matches(filter, *edge)) result.push_back(*std::move(edge));
                    return true;
                  });
        std::sort(result.begin(), result.end(), [](const auto &a, const auto &b) { return a.key() < b.key(); });
        if (result.size() > filter.limit) {
          result.erase(result.begin() + static_cast<std::ptrdiff_t>(filter.limit), result.end());
        }
        return result;
      }

      if (filter.type) {
        txn_.Scan(disk::EdgeTypePrefix(*filter.type), {}, [&](std::string_view key, std::string_view) {
          auto edge = ReadEdge(disk::DecodeEdgeTypeKey<Id>(key));
          if (!edge) throw SerializationException("Edge type index points to a missing edge");
          return collect(*edge);
        });
        return result;
      }

      txn_.Scan(std::string(1, disk::kEdgePrefix), {}, [&](std::string_view key, std::string_view value) {
        auto [weight, update_datetime] = disk::DecodeEdgeValue(value);
        return collect(Edge<Id>(disk::DecodeEdgeKey<Id>(key), weight, update_datetime));
      });
      return result;
    }

    std::optional<Edge<Id>> ReadEdge(const EdgeKey<Id> &key) {
      auto value = txn_.Get(disk::EdgeKeyBytes(key));
      if (!value) return std::nullopt;
      auto [weight, update_datetime] = disk::DecodeEdgeValue(*value);
      return Edge<Id>(key, weight, update_datetime);
    }

    void DeleteEdge(const EdgeKey<Id> &key) {
      txn_.Delete(disk::EdgeKeyBytes(key));
      txn_.Delete(disk::ReversedEdgeKeyBytes(key));
      txn_.Delete(disk::EdgeTypeKeyBytes(key));
    }

    uint64_t Count(const std::string &prefix) {
      uint64_t count = 0;
      txn_.Scan(prefix, {}, [&](std::string_view, std::string_view) {
        ++count;
        return true;
      });
      return count;
    }

    static Type DecodeStoredType(std::string_view value) {
      auto type = Type::New(std::string(value));
      if (!type) throw SerializationException("Invalid stored vertex type: {}", ValidationErrorToString(type.error()));
      return *std::move(type);
    }

    kvstore::KVStore::Transaction txn_;
  };

  /// Opens (creating when missing) the database stored under `path`.
  ///
  /// @throw kvstore::KVStoreError if the database can't be opened.
  explicit RocksdbDatastore(std::filesystem::path path) : kvstore_(std::move(path)) {}

  /// @throw kvstore::KVStoreError if no transaction can be started.
  Accessor Access() { return Accessor{kvstore_.BeginTransaction()}; }

  Result<bool> CreateVertex(const Vertex<Id> &vertex) {
    return WithAccessor([&](Accessor &accessor) { return accessor.CreateVertex(vertex); });
  }

  Result<std::vector<Vertex<Id>>> GetVertices(const VertexQuery<Id> &query) {
    return WithAccessor([&](Accessor &accessor) { return accessor.GetVertices(query); });
  }

  Result<void> DeleteVertices(const VertexQuery<Id> &query) {
    return WithAccessor([&](Accessor &accessor) { return accessor.DeleteVertices(query); });
  }

  Result<uint64_t> GetVertexCount() {
    return WithAccessor([](Accessor &accessor) { return accessor.GetVertexCount(); });
  }

  Result<bool> CreateEdge(const Edge<Id> &edge) {
    return WithAccessor([&](Accessor &accessor) { return accessor.CreateEdge(edge); });
  }

  Result<std::vector<Edge<Id>>> GetEdges(const EdgeQuery<Id> &query) {
    return WithAccessor([&](Accessor &accessor) { return accessor.GetEdges(query); });
  }

  Result<void> DeleteEdges(const EdgeQuery<Id> &query) {
    return WithAccessor([&](Accessor &accessor) { return accessor.DeleteEdges(query); });
  }

  Result<uint64_t> GetEdgeCount(const Id &id, const std::optional<Type> &type, EdgeDirection direction) {
    return WithAccessor([&](Accessor &accessor) { return accessor.GetEdgeCount(id, type, direction); });
  }

  Result<std::vector<OperationResult<Id>>> Transaction(std::vector<Operation<Id>> operations) {
    return WithAccessor([&](Accessor &accessor) { return ApplyOperations<Id>(accessor, operations); });
  }

 private:
  template <typename TFunc>
  auto WithAccessor(TFunc &&func) {
    return Guarded([&] {
      auto accessor = Access();
      auto result = func(accessor);
      if (result) {
        accessor.Commit();
      } else {
        spdlog::trace("Discarding RocksDB transaction: {}", result.error().message);
      }
      return result;
    });
  }

  kvstore::KVStore kvstore_;
};

}  // namespace trellis::storage
