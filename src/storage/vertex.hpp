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

#include "storage/id.hpp"
#include "storage/types.hpp"

namespace trellis::storage {

/// A vertex.
///
/// Vertices represent nouns in the datastore, e.g. a user or a movie. Every
/// vertex has an identifier and a type. Two vertices are the same vertex when
/// their identifiers are equal, the type is not part of the identity.
template <Identifier Id>
class Vertex final {
 public:
  Vertex(Id id, Type type) : id_(std::move(id)), type_(std::move(type)) {}

  const Id &id() const { return id_; }
  const Type &type() const { return type_; }

  void set_type(Type type) { type_ = std::move(type); }

  friend bool operator==(const Vertex &a, const Vertex &b) { return a.id_ == b.id_; }

 private:
  Id id_;
  Type type_;
};

}  // namespace trellis::storage
