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

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "utils/exceptions.hpp"

namespace trellis::kvstore {

class KVStoreError : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(KVStoreError)
};

/**
 * Ordered, durable key-value store backed by a RocksDB TransactionDB. Keys
 * are compared bytewise. All methods are thread safe.
 */
class KVStore final {
 public:
  KVStore() = delete;

  /**
   * @param storage Path to a directory where the data is persisted. It is
   *        created when missing.
   *
   * NOTE: Only one KVStore may use a storage directory at a time, RocksDB
   *       refuses to open a locked database.
   *
   * @throw KVStoreError if the database can't be opened.
   */
  explicit KVStore(std::filesystem::path storage);

  KVStore(const KVStore &other) = delete;
  KVStore(KVStore &&other) noexcept;

  KVStore &operator=(const KVStore &other) = delete;
  KVStore &operator=(KVStore &&other) noexcept;

  ~KVStore();

  /**
   * Pessimistic read-write transaction over the store.
   *
   * Reads observe the transaction's own writes. Keys are locked when they are
   * written or read through `GetForUpdate` and stay locked until the
   * transaction commits or rolls back, conflicting transactions fail with
   * `KVStoreError` once the lock timeout expires. A transaction destroyed
   * without a commit is rolled back.
   *
   * Every failure reported by RocksDB is thrown as `KVStoreError`.
   */
  class Transaction final {
   public:
    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;
    Transaction(Transaction &&other) noexcept;
    Transaction &operator=(Transaction &&other) noexcept;
    ~Transaction();

    std::optional<std::string> Get(std::string_view key);

    /// Like `Get` but also locks `key` until the end of the transaction.
    std::optional<std::string> GetForUpdate(std::string_view key);

    void Put(std::string_view key, std::string_view value);

    void Delete(std::string_view key);

    /// Visits keys starting with `prefix` in ascending order, beginning at
    /// `seek_key` (or at `prefix` when it is empty), until `callback` returns
    /// false.
    void Scan(std::string_view prefix, std::string_view seek_key,
              const std::function<bool(std::string_view key, std::string_view value)> &callback);

    void Commit();
    void Rollback();

   private:
    friend class KVStore;
    struct impl;
    explicit Transaction(std::unique_ptr<impl> pimpl);
    std::unique_ptr<impl> pimpl_;
  };

  /// @throw KVStoreError if RocksDB refuses to start a transaction.
  Transaction BeginTransaction();

 private:
  struct impl;
  std::unique_ptr<impl> pimpl_;
};

}  // namespace trellis::kvstore
