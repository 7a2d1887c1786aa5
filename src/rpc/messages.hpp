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

#include <string_view>

#include <nlohmann/json.hpp>

#include "storage/error.hpp"

// Envelope of the RPC messages.
//
//   request:  {"type": "<operation>", ...operation fields}
//             {"type": "transaction", "operations": [<request>, ...]}
//   response: {"status": "ok", "result": <result>}
//             {"status": "ok", "results": [<result>, ...]}
//             {"status": "error", "error": {"kind": "...", "message": "..."}}
namespace trellis::rpc {

inline constexpr auto kTransactionType = "transaction";

nlohmann::json OkResponse(nlohmann::json result);
nlohmann::json OkResponses(nlohmann::json results);
nlohmann::json ErrorResponse(const storage::Error &error);

/// Splits a response into its payload (`result` or `results`, selected by
/// `field`) and the error it carries.
///
/// @throw storage::SerializationException if the envelope is malformed.
storage::Result<nlohmann::json> UnwrapResponse(const nlohmann::json &response, std::string_view field);

}  // namespace trellis::rpc
