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

#include <netdb.h>

#include <string>
#include <utility>

#include "io/network/endpoint.hpp"

namespace trellis::io::network {

/**
 * Wrapper class for getaddrinfo.
 * see: man 3 getaddrinfo
 */
class AddrInfo {
 public:
  AddrInfo(const AddrInfo &) = delete;
  AddrInfo &operator=(const AddrInfo &) = delete;
  AddrInfo(AddrInfo &&other) noexcept : info_(std::exchange(other.info_, nullptr)) {}
  AddrInfo &operator=(AddrInfo &&) = delete;
  ~AddrInfo();

  /// Resolves `endpoint` for a TCP socket. Passive lookups are used for
  /// binding.
  ///
  /// @throw NetworkError if the address can't be resolved.
  static AddrInfo Get(const Endpoint &endpoint, bool passive);

  class Iterator {
   public:
    explicit Iterator(addrinfo *current) : current_(current) {}
    addrinfo &operator*() const { return *current_; }
    addrinfo *operator->() const { return current_; }
    Iterator &operator++() {
      current_ = current_->ai_next;
      return *this;
    }
    bool operator==(const Iterator &) const = default;

   private:
    addrinfo *current_;
  };

  Iterator begin() const { return Iterator(info_); }
  Iterator end() const { return Iterator(nullptr); }

 private:
  explicit AddrInfo(addrinfo *info) : info_(info) {}

  addrinfo *info_;
};

}  // namespace trellis::io::network
