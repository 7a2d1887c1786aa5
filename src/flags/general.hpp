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
#include <string_view>

#include "gflags/gflags.h"

DECLARE_string(datastore);
DECLARE_string(bind_address);
DECLARE_uint64(workers);
DECLARE_string(id_type);

namespace trellis::flags {

/// Identifier flavour the server stores its vertices under.
enum class IdType : uint8_t { Uuid, Uint, String };

bool ValidIdType(std::string_view value);
IdType ParseIdType(std::string_view value);

}  // namespace trellis::flags
