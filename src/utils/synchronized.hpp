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

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace trellis::utils {

/// Couples an object with the mutex guarding it so the object is only
/// reachable through a lock:
///
///   Synchronized<State, std::shared_mutex> state_;
///
///   auto locked = state_.Lock();   // exclusive, movable handle
///   locked->vertices.emplace(id, type);
///
///   state_.WithReadLock([](const State &state) { return state.vertices.size(); });
template <class T, class TMutex = std::mutex>
class Synchronized {
 public:
  template <class... Args>
  explicit Synchronized(Args &&...args) : object_(std::forward<Args>(args)...) {}

  Synchronized(const Synchronized &) = delete;
  Synchronized(Synchronized &&) = delete;
  Synchronized &operator=(const Synchronized &) = delete;
  Synchronized &operator=(Synchronized &&) = delete;
  ~Synchronized() = default;

  /// Exclusive access, released when the handle is destroyed.
  class LockedPtr {
   public:
    T *operator->() const { return object_; }
    T &operator*() const { return *object_; }

   private:
    friend class Synchronized;
    LockedPtr(T *object, TMutex &mutex) : object_(object), guard_(mutex) {}

    T *object_;
    std::unique_lock<TMutex> guard_;
  };

  LockedPtr Lock() { return LockedPtr(&object_, mutex_); }

  /// Calls `callable` with a const reference under a shared lock.
  template <class TCallable>
  requires requires(TMutex mutex) { mutex.lock_shared(); }
  decltype(auto) WithReadLock(TCallable &&callable) const {
    std::shared_lock guard(mutex_);
    return std::forward<TCallable>(callable)(std::as_const(object_));
  }

 private:
  T object_;
  mutable TMutex mutex_;
};

}  // namespace trellis::utils
