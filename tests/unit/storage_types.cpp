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

#include <cmath>
#include <limits>
#include <string>

#include <gtest/gtest.h>

#include "storage/edge.hpp"
#include "storage/error.hpp"
#include "storage/types.hpp"
#include "storage/vertex.hpp"
#include "utils/timestamp.hpp"
#include "utils/uuid.hpp"

using trellis::storage::Edge;
using trellis::storage::EdgeKey;
using trellis::storage::Type;
using trellis::storage::ValidationError;
using trellis::storage::Vertex;
using trellis::storage::Weight;
using trellis::utils::Timestamp;

namespace {
Type MakeType(std::string value) { return *Type::New(std::move(value)); }
}  // namespace

TEST(StorageType, AcceptsIdentifierCharacters) {
  for (auto const *value : {"a", "Z", "0", "follows", "likes_2", "is-part-of", "A_b-C_9"}) {
    auto type = Type::New(value);
    ASSERT_TRUE(type.has_value()) << value;
    EXPECT_EQ(type->AsString(), value);
  }
}

TEST(StorageType, RejectsOtherCharacters) {
  for (auto const *value : {"", " ", "has space", "dot.ted", "slash/", "ünïcode", "tab\t", "new\nline"}) {
    auto type = Type::New(value);
    ASSERT_FALSE(type.has_value()) << value;
    EXPECT_EQ(type.error(), ValidationError::InvalidValue);
  }
}

TEST(StorageType, LengthLimit) {
  EXPECT_TRUE(Type::New(std::string(Type::kMaxLength, 'a')).has_value());

  auto too_long = Type::New(std::string(Type::kMaxLength + 1, 'a'));
  ASSERT_FALSE(too_long.has_value());
  EXPECT_EQ(too_long.error(), ValidationError::ValueTooLong);

  // Length is checked before the characters.
  auto too_long_and_invalid = Type::New(std::string(Type::kMaxLength + 1, '.'));
  ASSERT_FALSE(too_long_and_invalid.has_value());
  EXPECT_EQ(too_long_and_invalid.error(), ValidationError::ValueTooLong);
}

TEST(StorageType, Ordering) {
  EXPECT_LT(MakeType("A"), MakeType("a"));
  EXPECT_LT(MakeType("a"), MakeType("ab"));
  EXPECT_EQ(MakeType("edge"), MakeType("edge"));
}

TEST(StorageWeight, Bounds) {
  for (float value : {-1.0F, -0.5F, 0.0F, 0.25F, 1.0F}) {
    auto weight = Weight::New(value);
    ASSERT_TRUE(weight.has_value()) << value;
    EXPECT_EQ(weight->AsFloat(), value);
  }
  for (float value : {-1.0001F, 1.0001F, 2.0F, -std::numeric_limits<float>::infinity(),
                      std::numeric_limits<float>::infinity(), std::numeric_limits<float>::quiet_NaN()}) {
    auto weight = Weight::New(value);
    ASSERT_FALSE(weight.has_value()) << value;
    EXPECT_EQ(weight.error(), ValidationError::InvalidValue);
  }
}

TEST(StorageError, KindNames) {
  using trellis::storage::ErrorKind;
  for (auto kind : {ErrorKind::Serialization, ErrorKind::BackendStorage, ErrorKind::UuidTaken}) {
    EXPECT_EQ(trellis::storage::ErrorKindFromString(trellis::storage::ErrorKindToString(kind)), kind);
  }
  EXPECT_EQ(trellis::storage::ErrorKindToString(ErrorKind::UuidTaken), "uuid_taken");
  EXPECT_FALSE(trellis::storage::ErrorKindFromString("timeout").has_value());
}

TEST(StorageVertex, IdentityIsTheId) {
  Vertex<uint64_t> vertex(7, MakeType("person"));
  Vertex<uint64_t> same_id(7, MakeType("robot"));
  Vertex<uint64_t> other_id(8, MakeType("person"));
  EXPECT_EQ(vertex, same_id);
  EXPECT_NE(vertex, other_id);
}

TEST(StorageEdgeKey, OrdersByOutboundTypeInbound) {
  EdgeKey<uint64_t> a{1, MakeType("b"), 9};
  EdgeKey<uint64_t> b{2, MakeType("a"), 0};
  EdgeKey<uint64_t> c{2, MakeType("b"), 0};
  EdgeKey<uint64_t> d{2, MakeType("b"), 1};
  EXPECT_LT(a, b);
  EXPECT_LT(b, c);
  EXPECT_LT(c, d);
}

TEST(StorageEdge, CurrentDatetime) {
  auto const before = Timestamp::Now();
  auto edge = Edge<std::string>::NewWithCurrentDatetime("alice", MakeType("knows"), "bob", *Weight::New(0.5F));
  auto const after = Timestamp::Now();

  EXPECT_EQ(edge.outbound_id(), "alice");
  EXPECT_EQ(edge.type(), MakeType("knows"));
  EXPECT_EQ(edge.inbound_id(), "bob");
  EXPECT_EQ(edge.weight(), *Weight::New(0.5F));
  EXPECT_LE(before, edge.update_datetime());
  EXPECT_LE(edge.update_datetime(), after);
}

TEST(StorageEdge, IdentityIsTheKey) {
  Edge<uint64_t> edge(1, MakeType("t"), 2, *Weight::New(0.1F), Timestamp(10));
  Edge<uint64_t> updated(1, MakeType("t"), 2, *Weight::New(-0.9F), Timestamp(20));
  Edge<uint64_t> reversed(2, MakeType("t"), 1, *Weight::New(0.1F), Timestamp(10));
  EXPECT_EQ(edge, updated);
  EXPECT_NE(edge, reversed);
}

TEST(UtilsTimestamp, Iso8601) {
  EXPECT_EQ(Timestamp(0).ToIso8601(), "1970-01-01T00:00:00.000000000Z");
  EXPECT_EQ(Timestamp(1'500'000'000'123'456'789).ToIso8601(), "2017-07-14T02:40:00.123456789Z");
  EXPECT_EQ(Timestamp(-1).ToIso8601(), "1969-12-31T23:59:59.999999999Z");
}

TEST(UtilsTimestamp, Ordering) {
  EXPECT_LT(Timestamp(-5), Timestamp(0));
  EXPECT_LT(Timestamp(0), Timestamp(1));
  EXPECT_EQ(Timestamp(42).NanoSecSinceTheEpoch(), 42);
}

TEST(UtilsUUID, TextRoundTrip) {
  trellis::utils::UUID uuid;
  auto const text = static_cast<std::string>(uuid);
  EXPECT_EQ(text.size(), 36U);

  auto parsed = trellis::utils::UUID::Parse(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, uuid);

  EXPECT_FALSE(trellis::utils::UUID::Parse("not-a-uuid").has_value());
  EXPECT_FALSE(trellis::utils::UUID::Parse("zzzzzzzz-zzzz-zzzz-zzzz-zzzzzzzzzzzz").has_value());
}

TEST(UtilsUUID, Unique) {
  trellis::utils::UUID a;
  trellis::utils::UUID b;
  EXPECT_NE(a, b);
}
