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

#include <compare>

#include "storage/id.hpp"
#include "storage/types.hpp"
#include "utils/timestamp.hpp"

namespace trellis::storage {

/// Identity of an edge. At most one edge exists per key, creating an edge
/// with an existing key updates the stored one.
template <Identifier Id>
struct EdgeKey {
  Id outbound_id;
  Type type;
  Id inbound_id;

  friend bool operator==(const EdgeKey &, const EdgeKey &) = default;
  friend auto operator<=>(const EdgeKey &, const EdgeKey &) = default;
};

/// An edge.
///
/// Edges represent verbs or relationships, e.g. "liked" or "reviewed". Edges
/// are typed, weighted and directed. The weight and the update timestamp are
/// mutable payload, equality only considers the key.
template <Identifier Id>
class Edge final {
 public:
  Edge(Id outbound_id, Type type, Id inbound_id, Weight weight, utils::Timestamp update_datetime)
      : key_{std::move(outbound_id), std::move(type), std::move(inbound_id)},
        weight_(weight),
        update_datetime_(update_datetime) {}

  Edge(EdgeKey<Id> key, Weight weight, utils::Timestamp update_datetime)
      : key_(std::move(key)), weight_(weight), update_datetime_(update_datetime) {}

  /// Creates a new edge stamped with the current UTC time.
  static Edge NewWithCurrentDatetime(Id outbound_id, Type type, Id inbound_id, Weight weight) {
    return Edge(std::move(outbound_id), std::move(type), std::move(inbound_id), weight, utils::Timestamp::Now());
  }

  const EdgeKey<Id> &key() const { return key_; }
  const Id &outbound_id() const { return key_.outbound_id; }
  const Type &type() const { return key_.type; }
  const Id &inbound_id() const { return key_.inbound_id; }

  Weight weight() const { return weight_; }
  void set_weight(Weight weight) { weight_ = weight; }

  utils::Timestamp update_datetime() const { return update_datetime_; }
  void set_update_datetime(utils::Timestamp update_datetime) { update_datetime_ = update_datetime; }

  friend bool operator==(const Edge &a, const Edge &b) { return a.key_ == b.key_; }

 private:
  EdgeKey<Id> key_;
  Weight weight_;
  utils::Timestamp update_datetime_;
};

}  // namespace trellis::storage
