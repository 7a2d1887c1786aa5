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

#include <vector>

#include <nlohmann/json.hpp>

#include "rpc/messages.hpp"
#include "rpc/server.hpp"
#include "storage/datastore.hpp"
#include "storage/operation.hpp"
#include "storage/serialization.hpp"

namespace trellis::rpc {

/// Serves every operation of the datastore contract, and batched
/// transactions, from `datastore`. The datastore must outlive the server.
template <storage::Datastore TDatastore>
void RegisterDatastoreRpcs(Server *server, TDatastore *datastore) {
  using Id = typename TDatastore::IdType;

  auto single = [datastore](const nlohmann::json &request) {
    auto const operation = storage::OperationFromJson<Id>(request);
    auto result = storage::ApplyOperation<Id>(*datastore, operation);
    if (!result) return ErrorResponse(result.error());
    return OkResponse(storage::ToJson<Id>(*result));
  };

  server->Register(storage::CreateVertexOp<Id>::kType, single);
  server->Register(storage::GetVerticesOp<Id>::kType, single);
  server->Register(storage::DeleteVerticesOp<Id>::kType, single);
  server->Register(storage::GetVertexCountOp::kType, single);
  server->Register(storage::CreateEdgeOp<Id>::kType, single);
  server->Register(storage::GetEdgesOp<Id>::kType, single);
  server->Register(storage::DeleteEdgesOp<Id>::kType, single);
  server->Register(storage::GetEdgeCountOp<Id>::kType, single);

  server->Register(kTransactionType, [datastore](const nlohmann::json &request) {
    auto operations = storage::ArrayFromJson(storage::RequireArray(request, "operations"),
                                             [](const nlohmann::json &op) { return storage::OperationFromJson<Id>(op); });
    auto results = datastore->Transaction(std::move(operations));
    if (!results) return ErrorResponse(results.error());
    auto json = nlohmann::json::array();
    for (const auto &result : *results) json.push_back(storage::ToJson<Id>(result));
    return OkResponses(std::move(json));
  });
}

}  // namespace trellis::rpc
