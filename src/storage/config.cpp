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

#include "storage/config.hpp"

namespace trellis::storage {

namespace {
constexpr std::string_view kMemoryScheme = "memory://";
constexpr std::string_view kRocksdbScheme = "rocksdb://";
}  // namespace

Config Config::FromUri(std::string_view uri) {
  if (uri.starts_with(kMemoryScheme)) {
    if (uri.size() != kMemoryScheme.size()) {
      throw ConfigException("The in memory datastore doesn't take a path, got '{}'", uri);
    }
    return Config{.backend = Backend::InMemory};
  }
  if (uri.starts_with(kRocksdbScheme)) {
    auto const path = uri.substr(kRocksdbScheme.size());
    if (path.empty()) throw ConfigException("Missing database path in '{}'", uri);
    return Config{.backend = Backend::Rocksdb, .durability_directory = std::filesystem::path(path)};
  }
  throw ConfigException("Unsupported datastore '{}', expected memory:// or rocksdb://<path>", uri);
}

std::string_view BackendToString(Config::Backend backend) {
  switch (backend) {
    case Config::Backend::InMemory:
      return "in memory";
    case Config::Backend::Rocksdb:
      return "RocksDB";
  }
  return "unknown";
}

}  // namespace trellis::storage
