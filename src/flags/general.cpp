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

#include "flags/general.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

DEFINE_string(datastore, "memory://", "Datastore to serve: memory:// or rocksdb://<path>.");
DEFINE_string(bind_address, "127.0.0.1:27615",
              "Address (host:port) the server listens on. The port defaults to 27615.");
DEFINE_VALIDATED_uint64(workers, std::max(std::thread::hardware_concurrency(), 1U),
                        "Number of worker threads serving connections.", FLAG_IN_RANGE(1, 1024));
DEFINE_VALIDATED_string(id_type, "uuid", "Identifier type of the vertices: uuid, uint or string.",
                        { return trellis::flags::ValidIdType(value); });

bool trellis::flags::ValidIdType(std::string_view value) {
  if (value == "uuid" || value == "uint" || value == "string") return true;
  std::cout << "Invalid value for --id_type. Allowed values: uuid, uint, string" << std::endl;
  return false;
}

trellis::flags::IdType trellis::flags::ParseIdType(std::string_view value) {
  if (value == "uint") return IdType::Uint;
  if (value == "string") return IdType::String;
  TR_ASSERT(value == "uuid", "Invalid identifier type {}", value);
  return IdType::Uuid;
}
