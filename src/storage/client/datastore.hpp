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

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "io/network/endpoint.hpp"
#include "rpc/client.hpp"
#include "rpc/exceptions.hpp"
#include "rpc/messages.hpp"
#include "storage/datastore.hpp"
#include "storage/error.hpp"
#include "storage/operation.hpp"
#include "storage/serialization.hpp"
#include "utils/logging.hpp"

namespace trellis::storage {

/// Datastore served by a remote trellis server. Every call is a single
/// request/response exchange, a transaction is one request carrying all of
/// its operations. Transport failures are reported as `BackendStorage` and
/// undecodable responses as `Serialization`. Nothing is retried.
template <Identifier Id>
class ClientDatastore final {
 public:
  using IdType = Id;

  explicit ClientDatastore(io::network::Endpoint endpoint,
                           std::chrono::milliseconds timeout = rpc::Client::kDefaultTimeout)
      : client_(std::move(endpoint), timeout) {}

  Result<bool> CreateVertex(const Vertex<Id> &vertex) { return Call<bool>(CreateVertexOp<Id>{vertex}); }

  Result<std::vector<Vertex<Id>>> GetVertices(const VertexQuery<Id> &query) {
    return Call<std::vector<Vertex<Id>>>(GetVerticesOp<Id>{query});
  }

  Result<void> DeleteVertices(const VertexQuery<Id> &query) {
    return Call<std::monostate>(DeleteVerticesOp<Id>{query}).transform([](std::monostate) {});
  }

  Result<uint64_t> GetVertexCount() { return Call<uint64_t>(GetVertexCountOp{}); }

  Result<bool> CreateEdge(const Edge<Id> &edge) { return Call<bool>(CreateEdgeOp<Id>{edge}); }

  Result<std::vector<Edge<Id>>> GetEdges(const EdgeQuery<Id> &query) {
    return Call<std::vector<Edge<Id>>>(GetEdgesOp<Id>{query});
  }

  Result<void> DeleteEdges(const EdgeQuery<Id> &query) {
    return Call<std::monostate>(DeleteEdgesOp<Id>{query}).transform([](std::monostate) {});
  }

  Result<uint64_t> GetEdgeCount(const Id &id, const std::optional<Type> &type, EdgeDirection direction) {
    return Call<uint64_t>(GetEdgeCountOp<Id>{.id = id, .type = type, .direction = direction});
  }

  Result<std::vector<OperationResult<Id>>> Transaction(std::vector<Operation<Id>> operations) {
    auto request = nlohmann::json{{"type", rpc::kTransactionType}, {"operations", nlohmann::json::array()}};
    for (const auto &operation : operations) request["operations"].push_back(ToJson<Id>(operation));

    return Exchange(request, "results", [&](const nlohmann::json &payload) {
      auto results = ArrayFromJson(payload, [](const nlohmann::json &result) { return OperationResultFromJson<Id>(result); });
      if (results.size() != operations.size()) {
        throw SerializationException("Expected {} results, got {}", operations.size(), results.size());
      }
      return results;
    });
  }

  const io::network::Endpoint &endpoint() const { return client_.endpoint(); }

 private:
  template <typename TValue>
  Result<TValue> Call(Operation<Id> operation) {
    return Exchange(ToJson<Id>(operation), "result", [](const nlohmann::json &payload) {
      auto result = OperationResultFromJson<Id>(payload);
      auto *value = std::get_if<TValue>(&result);
      if (!value) throw SerializationException("Unexpected kind of result");
      return std::move(*value);
    });
  }

  template <typename TDecode>
  auto Exchange(const nlohmann::json &request, std::string_view field, TDecode &&decode)
      -> Result<decltype(decode(std::declval<const nlohmann::json &>()))> {
    try {
      auto payload = rpc::UnwrapResponse(client_.Call(request), field);
      if (!payload) return std::unexpected{std::move(payload.error())};
      return decode(*payload);
    } catch (const rpc::MalformedRpcMessageException &e) {
      spdlog::trace("Malformed response from {}: {}", client_.endpoint(), e.what());
      return std::unexpected{Error::Serialization(e.what())};
    } catch (const rpc::RpcFailedException &e) {
      spdlog::trace("Request to {} failed: {}", client_.endpoint(), e.what());
      return std::unexpected{Error::BackendStorage(e.what())};
    } catch (const SerializationException &e) {
      return std::unexpected{Error::Serialization(e.what())};
    } catch (const nlohmann::json::exception &e) {
      return std::unexpected{Error::Serialization(e.what())};
    }
  }

  rpc::Client client_;
};

}  // namespace trellis::storage
