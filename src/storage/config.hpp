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
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "storage/disk/datastore.hpp"
#include "storage/id.hpp"
#include "storage/inmemory/datastore.hpp"
#include "utils/exceptions.hpp"

namespace trellis::storage {

class ConfigException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(ConfigException)
};

/// Backend selected at startup by the datastore URI:
///
///   memory://           in memory, nothing survives a restart
///   rocksdb://<path>    RocksDB database stored under <path>
struct Config {
  enum class Backend : uint8_t { InMemory, Rocksdb };

  Backend backend{Backend::InMemory};
  std::filesystem::path durability_directory;

  /// @throw ConfigException on an unknown scheme or a missing path.
  static Config FromUri(std::string_view uri);
};

std::string_view BackendToString(Config::Backend backend);

template <Identifier Id>
using AnyDatastore = std::variant<std::unique_ptr<InMemoryDatastore<Id>>, std::unique_ptr<RocksdbDatastore<Id>>>;

/// Creates the backend described by `config`.
///
/// @throw kvstore::KVStoreError if the RocksDB database can't be opened.
template <Identifier Id>
AnyDatastore<Id> MakeDatastore(const Config &config) {
  switch (config.backend) {
    case Config::Backend::InMemory:
      return std::make_unique<InMemoryDatastore<Id>>();
    case Config::Backend::Rocksdb:
      return std::make_unique<RocksdbDatastore<Id>>(config.durability_directory);
  }
  throw ConfigException("Unknown backend");
}

}  // namespace trellis::storage
