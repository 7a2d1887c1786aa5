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

#include "rpc/messages.hpp"

#include "storage/serialization.hpp"

namespace trellis::rpc {

nlohmann::json OkResponse(nlohmann::json result) { return {{"status", "ok"}, {"result", std::move(result)}}; }

nlohmann::json OkResponses(nlohmann::json results) { return {{"status", "ok"}, {"results", std::move(results)}}; }

nlohmann::json ErrorResponse(const storage::Error &error) {
  return {{"status", "error"}, {"error", storage::ToJson(error)}};
}

storage::Result<nlohmann::json> UnwrapResponse(const nlohmann::json &response, std::string_view field) {
  auto const status = storage::RequireString(response, "status");
  if (status == "ok") return storage::RequireField(response, field);
  if (status == "error") return std::unexpected{storage::ErrorFromJson(storage::RequireField(response, "error"))};
  throw storage::SerializationException("Unknown response status '{}'", status);
}

}  // namespace trellis::rpc
