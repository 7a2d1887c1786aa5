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

#include "kvstore/kvstore.hpp"

#include <rocksdb/db.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <spdlog/spdlog.h>

#include "utils/file.hpp"

namespace trellis::kvstore {

namespace {

void ThrowOnError(const rocksdb::Status &status, std::string_view what) {
  if (!status.ok()) throw KVStoreError("{} failed: {}", what, status.ToString());
}

rocksdb::Options DefaultOptions() {
  rocksdb::Options options;
  options.create_if_missing = true;
  return options;
}

// Calls `callback` for every key of `iter` starting with `prefix`, beginning
// at `seek_key`.
void VisitPrefix(rocksdb::Iterator *iter, std::string_view prefix, std::string_view seek_key,
                 const std::function<bool(std::string_view, std::string_view)> &callback) {
  const rocksdb::Slice rocksdb_prefix(prefix.data(), prefix.size());
  iter->Seek(seek_key.empty() ? prefix : seek_key);
  for (; iter->Valid() && iter->key().starts_with(rocksdb_prefix); iter->Next()) {
    if (!callback(iter->key().ToStringView(), iter->value().ToStringView())) return;
  }
  ThrowOnError(iter->status(), "Scan");
}

}  // namespace

struct KVStore::impl {
  std::filesystem::path storage;
  std::unique_ptr<rocksdb::TransactionDB> db;
};

KVStore::KVStore(std::filesystem::path storage) : pimpl_(std::make_unique<impl>()) {
  pimpl_->storage = std::move(storage);
  if (!utils::EnsureDir(pimpl_->storage)) {
    throw KVStoreError("Folder for the key-value store {} couldn't be initialized!", pimpl_->storage.string());
  }
  rocksdb::TransactionDB *db = nullptr;
  auto s =
      rocksdb::TransactionDB::Open(DefaultOptions(), rocksdb::TransactionDBOptions{}, pimpl_->storage.string(), &db);
  if (!s.ok()) {
    throw KVStoreError("RocksDB couldn't be initialized inside {} -- {}", pimpl_->storage.string(), s.ToString());
  }
  pimpl_->db.reset(db);
  spdlog::debug("Opened KVStore at {}", pimpl_->storage.string());
}

KVStore::~KVStore() {
  if (pimpl_ == nullptr) return;
  spdlog::debug("Closing KVStore at {}", pimpl_->storage.string());
  const auto sync = pimpl_->db->SyncWAL();
  if (!sync.ok()) spdlog::error("KVStore sync failed: {}", sync.ToString());
  const auto close = pimpl_->db->Close();
  if (!close.ok()) spdlog::error("KVStore close failed: {}", close.ToString());
}

KVStore::KVStore(KVStore &&other) noexcept = default;

KVStore &KVStore::operator=(KVStore &&other) noexcept = default;

// transaction

struct KVStore::Transaction::impl {
  std::unique_ptr<rocksdb::Transaction> txn;
  bool finished{false};
};

KVStore::Transaction::Transaction(std::unique_ptr<impl> pimpl) : pimpl_(std::move(pimpl)) {}

KVStore::Transaction::Transaction(Transaction &&other) noexcept = default;

KVStore::Transaction &KVStore::Transaction::operator=(Transaction &&other) noexcept = default;

KVStore::Transaction::~Transaction() {
  if (pimpl_ == nullptr || pimpl_->finished) return;
  const auto s = pimpl_->txn->Rollback();
  if (!s.ok()) spdlog::error("KVStore transaction rollback failed: {}", s.ToString());
}

KVStore::Transaction KVStore::BeginTransaction() {
  auto txn_impl = std::make_unique<Transaction::impl>();
  txn_impl->txn.reset(pimpl_->db->BeginTransaction(rocksdb::WriteOptions{}, rocksdb::TransactionOptions{}));
  if (txn_impl->txn == nullptr) throw KVStoreError("Couldn't begin a RocksDB transaction");
  return Transaction(std::move(txn_impl));
}

std::optional<std::string> KVStore::Transaction::Get(std::string_view key) {
  std::string value;
  auto s = pimpl_->txn->Get(rocksdb::ReadOptions{}, key, &value);
  if (s.IsNotFound()) return std::nullopt;
  ThrowOnError(s, "Get");
  return value;
}

std::optional<std::string> KVStore::Transaction::GetForUpdate(std::string_view key) {
  std::string value;
  auto s = pimpl_->txn->GetForUpdate(rocksdb::ReadOptions{}, key, &value);
  if (s.IsNotFound()) return std::nullopt;
  ThrowOnError(s, "GetForUpdate");
  return value;
}

void KVStore::Transaction::Put(std::string_view key, std::string_view value) {
  ThrowOnError(pimpl_->txn->Put(key, value), "Put");
}

void KVStore::Transaction::Delete(std::string_view key) { ThrowOnError(pimpl_->txn->Delete(key), "Delete"); }

void KVStore::Transaction::Scan(std::string_view prefix, std::string_view seek_key,
                                const std::function<bool(std::string_view, std::string_view)> &callback) {
  std::unique_ptr<rocksdb::Iterator> iter(pimpl_->txn->GetIterator(rocksdb::ReadOptions{}));
  VisitPrefix(iter.get(), prefix, seek_key, callback);
}

void KVStore::Transaction::Commit() {
  ThrowOnError(pimpl_->txn->Commit(), "Commit");
  pimpl_->finished = true;
}

void KVStore::Transaction::Rollback() {
  pimpl_->finished = true;
  ThrowOnError(pimpl_->txn->Rollback(), "Rollback");
}

}  // namespace trellis::kvstore
