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

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "io/network/endpoint.hpp"
#include "io/network/socket.hpp"
#include "rpc/datastore_rpcs.hpp"
#include "rpc/server.hpp"
#include "storage/client/datastore.hpp"
#include "storage/datastore.hpp"
#include "storage/disk/datastore.hpp"
#include "storage/inmemory/datastore.hpp"

namespace fs = std::filesystem;
using namespace trellis::storage;
using trellis::utils::Timestamp;

namespace {

fs::path UniqueDirectory(std::string_view name) {
  static std::atomic<int> counter{0};
  return fs::temp_directory_path() /
         fmt::format("unit_{}_{}_{}", name, static_cast<int>(getpid()), counter.fetch_add(1));
}

template <Identifier Id>
class InMemoryHarness {
 public:
  InMemoryDatastore<Id> &datastore() { return datastore_; }

 private:
  InMemoryDatastore<Id> datastore_;
};

template <Identifier Id>
class RocksdbHarness {
 public:
  RocksdbHarness()
      : directory_(UniqueDirectory("rocksdb_datastore")),
        datastore_(std::make_unique<RocksdbDatastore<Id>>(directory_)) {}

  RocksdbHarness(const RocksdbHarness &) = delete;
  RocksdbHarness &operator=(const RocksdbHarness &) = delete;

  ~RocksdbHarness() {
    datastore_.reset();
    fs::remove_all(directory_);
  }

  RocksdbDatastore<Id> &datastore() { return *datastore_; }

 private:
  fs::path directory_;
  std::unique_ptr<RocksdbDatastore<Id>> datastore_;
};

// A server in front of an in-memory datastore, reached through the client.
template <Identifier Id>
class RemoteHarness {
 public:
  RemoteHarness() {
    trellis::rpc::RegisterDatastoreRpcs(&server_, &local_);
    EXPECT_TRUE(server_.Start());
    datastore_ = std::make_unique<ClientDatastore<Id>>(server_.endpoint());
  }

  RemoteHarness(const RemoteHarness &) = delete;
  RemoteHarness &operator=(const RemoteHarness &) = delete;

  ~RemoteHarness() {
    datastore_.reset();
    server_.Shutdown();
    server_.AwaitShutdown();
  }

  ClientDatastore<Id> &datastore() { return *datastore_; }

 private:
  InMemoryDatastore<Id> local_;
  trellis::rpc::Server server_{trellis::io::network::Endpoint("127.0.0.1", 0), 2};
  std::unique_ptr<ClientDatastore<Id>> datastore_;
};

Type T(std::string value) { return *Type::New(std::move(value)); }
Weight W(float value) { return *Weight::New(value); }

std::vector<uint64_t> Ids(const std::vector<Vertex<uint64_t>> &vertices) {
  std::vector<uint64_t> ids;
  for (const auto &vertex : vertices) ids.push_back(vertex.id());
  return ids;
}

std::vector<EdgeKey<uint64_t>> Keys(const std::vector<Edge<uint64_t>> &edges) {
  std::vector<EdgeKey<uint64_t>> keys;
  for (const auto &edge : edges) keys.push_back(edge.key());
  return keys;
}

FilteredEdgeQuery<uint64_t> AllEdges(uint32_t limit = 1000) { return FilteredEdgeQuery<uint64_t>{.limit = limit}; }

}  // namespace

template <typename THarness>
class DatastoreTest : public ::testing::Test {
 protected:
  auto &datastore() { return harness_.datastore(); }

  void CreateVertices(std::initializer_list<std::pair<uint64_t, const char *>> vertices) {
    for (const auto &[id, type] : vertices) {
      auto created = datastore().CreateVertex(Vertex<uint64_t>(id, T(type)));
      ASSERT_TRUE(created.has_value()) << created.error().message;
      ASSERT_TRUE(*created);
    }
  }

  void CreateEdge(uint64_t from, const char *type, uint64_t to, float weight = 0.5F, int64_t timestamp = 1) {
    auto created = datastore().CreateEdge(Edge<uint64_t>(from, T(type), to, W(weight), Timestamp(timestamp)));
    ASSERT_TRUE(created.has_value()) << created.error().message;
    ASSERT_TRUE(*created);
  }

  std::vector<Edge<uint64_t>> GetEdges(const EdgeQuery<uint64_t> &query) {
    auto edges = datastore().GetEdges(query);
    EXPECT_TRUE(edges.has_value());
    return edges.value_or(std::vector<Edge<uint64_t>>{});
  }

  std::vector<Vertex<uint64_t>> GetVertices(const VertexQuery<uint64_t> &query) {
    auto vertices = datastore().GetVertices(query);
    EXPECT_TRUE(vertices.has_value());
    return vertices.value_or(std::vector<Vertex<uint64_t>>{});
  }

  THarness harness_;
};

using Harnesses =
    ::testing::Types<InMemoryHarness<uint64_t>, RocksdbHarness<uint64_t>, RemoteHarness<uint64_t>>;
TYPED_TEST_SUITE(DatastoreTest, Harnesses);

TYPED_TEST(DatastoreTest, SatisfiesTheContract) {
  static_assert(Datastore<std::remove_cvref_t<decltype(this->datastore())>>);
}

TYPED_TEST(DatastoreTest, CreateAndGetVertex) {
  this->CreateVertices({{1, "user"}});
  auto vertices = this->GetVertices(SpecificVertexQuery<uint64_t>{{1}});
  ASSERT_EQ(vertices.size(), 1);
  EXPECT_EQ(vertices[0].id(), 1U);
  EXPECT_EQ(vertices[0].type(), T("user"));
  EXPECT_TRUE(this->GetVertices(SpecificVertexQuery<uint64_t>{{2}}).empty());
}

TYPED_TEST(DatastoreTest, DuplicateVertexIsUuidTaken) {
  this->CreateVertices({{5, "user"}});
  auto again = this->datastore().CreateVertex(Vertex<uint64_t>(5, T("robot")));
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().kind, ErrorKind::UuidTaken);

  EXPECT_EQ(this->datastore().GetVertexCount(), 1U);
  auto vertices = this->GetVertices(SpecificVertexQuery<uint64_t>{{5}});
  ASSERT_EQ(vertices.size(), 1);
  EXPECT_EQ(vertices[0].type(), T("user"));
}

TYPED_TEST(DatastoreTest, SpecificVerticesAreSortedAndUnique) {
  this->CreateVertices({{3, "a"}, {1, "b"}, {2, "a"}});
  auto vertices = this->GetVertices(SpecificVertexQuery<uint64_t>{{3, 1, 3, 9, 2}});
  EXPECT_EQ(Ids(vertices), (std::vector<uint64_t>{1, 2, 3}));
}

TYPED_TEST(DatastoreTest, RangeVertexQuery) {
  this->CreateVertices({{10, "a"}, {20, "b"}, {30, "a"}, {40, "a"}, {50, "b"}});

  EXPECT_EQ(Ids(this->GetVertices(RangeVertexQuery<uint64_t>{.limit = 100})),
            (std::vector<uint64_t>{10, 20, 30, 40, 50}));
  EXPECT_EQ(Ids(this->GetVertices(RangeVertexQuery<uint64_t>{.limit = 2})), (std::vector<uint64_t>{10, 20}));
  EXPECT_TRUE(this->GetVertices(RangeVertexQuery<uint64_t>{.limit = 0}).empty());

  // `start_id` is exclusive.
  EXPECT_EQ(Ids(this->GetVertices(RangeVertexQuery<uint64_t>{.limit = 2, .start_id = 20})),
            (std::vector<uint64_t>{30, 40}));
  EXPECT_EQ(Ids(this->GetVertices(RangeVertexQuery<uint64_t>{.limit = 10, .start_id = 25})),
            (std::vector<uint64_t>{30, 40, 50}));

  EXPECT_EQ(Ids(this->GetVertices(RangeVertexQuery<uint64_t>{.limit = 10, .type = T("a")})),
            (std::vector<uint64_t>{10, 30, 40}));
  EXPECT_EQ(Ids(this->GetVertices(RangeVertexQuery<uint64_t>{.limit = 1, .type = T("a"), .start_id = 10})),
            (std::vector<uint64_t>{30}));
  EXPECT_TRUE(this->GetVertices(RangeVertexQuery<uint64_t>{.limit = 10, .type = T("c")}).empty());

  // Nothing follows the largest identifier.
  this->CreateVertices({{std::numeric_limits<uint64_t>::max(), "a"}});
  EXPECT_TRUE(
      this->GetVertices(RangeVertexQuery<uint64_t>{.limit = 10, .start_id = std::numeric_limits<uint64_t>::max()})
          .empty());
}

TYPED_TEST(DatastoreTest, CreateEdgeNeedsBothVertices) {
  this->CreateVertices({{1, "user"}});
  auto created = this->datastore().CreateEdge(Edge<uint64_t>(1, T("likes"), 2, W(0.8F), Timestamp(1)));
  ASSERT_TRUE(created.has_value());
  EXPECT_FALSE(*created);
  EXPECT_TRUE(this->GetEdges(AllEdges()).empty());
}

TYPED_TEST(DatastoreTest, LikesScenario) {
  this->CreateVertices({{1, "user"}, {2, "user"}});
  this->CreateEdge(1, "likes", 2, 0.8F);

  auto edges = this->GetEdges(FilteredEdgeQuery<uint64_t>{.outbound_id = 1, .limit = 10});
  ASSERT_EQ(edges.size(), 1);
  EXPECT_EQ(edges[0].key(), (EdgeKey<uint64_t>{1, T("likes"), 2}));
  EXPECT_EQ(edges[0].weight(), W(0.8F));

  ASSERT_TRUE(this->datastore().DeleteVertices(SpecificVertexQuery<uint64_t>{{1}}).has_value());
  EXPECT_TRUE(this->GetEdges(FilteredEdgeQuery<uint64_t>{.outbound_id = 1, .limit = 10}).empty());
  EXPECT_TRUE(this->GetVertices(SpecificVertexQuery<uint64_t>{{1}}).empty());
  EXPECT_EQ(this->datastore().GetVertexCount(), 1U);
}

TYPED_TEST(DatastoreTest, EdgeUpsert) {
  this->CreateVertices({{1, "user"}, {2, "user"}});
  this->CreateEdge(1, "likes", 2, 0.1F, 100);
  this->CreateEdge(1, "likes", 2, -0.7F, 200);

  auto edges = this->GetEdges(AllEdges());
  ASSERT_EQ(edges.size(), 1);
  EXPECT_EQ(edges[0].weight(), W(-0.7F));
  EXPECT_EQ(edges[0].update_datetime(), Timestamp(200));

  // The stored datetime never goes back.
  this->CreateEdge(1, "likes", 2, 0.3F, 150);
  edges = this->GetEdges(AllEdges());
  ASSERT_EQ(edges.size(), 1);
  EXPECT_EQ(edges[0].weight(), W(0.3F));
  EXPECT_EQ(edges[0].update_datetime(), Timestamp(200));

  // A different type is a different edge.
  this->CreateEdge(1, "follows", 2);
  EXPECT_EQ(this->GetEdges(AllEdges()).size(), 2);
}

TYPED_TEST(DatastoreTest, FilteredEdgeQueries) {
  this->CreateVertices({{1, "v"}, {2, "v"}, {3, "v"}});
  this->CreateEdge(1, "a", 2, -0.5F, 10);
  this->CreateEdge(1, "b", 3, 0.0F, 20);
  this->CreateEdge(2, "a", 3, 0.5F, 30);
  this->CreateEdge(3, "a", 1, 1.0F, 40);
  this->CreateEdge(3, "b", 2, -1.0F, 50);

  using Key = EdgeKey<uint64_t>;
  auto const k12a = Key{1, T("a"), 2};
  auto const k13b = Key{1, T("b"), 3};
  auto const k23a = Key{2, T("a"), 3};
  auto const k31a = Key{3, T("a"), 1};
  auto const k32b = Key{3, T("b"), 2};

  EXPECT_EQ(Keys(this->GetEdges(AllEdges())), (std::vector<Key>{k12a, k13b, k23a, k31a, k32b}));
  EXPECT_EQ(Keys(this->GetEdges(AllEdges(2))), (std::vector<Key>{k12a, k13b}));
  EXPECT_TRUE(this->GetEdges(AllEdges(0)).empty());

  EXPECT_EQ(Keys(this->GetEdges(FilteredEdgeQuery<uint64_t>{.outbound_id = 1, .type = T("b"), .limit = 10})),
            (std::vector<Key>{k13b}));
  // Inbound lookups come back in edge key order as well.
  EXPECT_EQ(Keys(this->GetEdges(FilteredEdgeQuery<uint64_t>{.inbound_id = 3, .limit = 10})),
            (std::vector<Key>{k13b, k23a}));
  EXPECT_EQ(Keys(this->GetEdges(FilteredEdgeQuery<uint64_t>{.inbound_id = 2, .limit = 1})),
            (std::vector<Key>{k12a}));
  EXPECT_EQ(Keys(this->GetEdges(FilteredEdgeQuery<uint64_t>{.type = T("a"), .limit = 10})),
            (std::vector<Key>{k12a, k23a, k31a}));
  EXPECT_EQ(Keys(this->GetEdges(FilteredEdgeQuery<uint64_t>{.outbound_id = 3, .inbound_id = 2, .limit = 10})),
            (std::vector<Key>{k32b}));

  // Weight and datetime bounds are inclusive.
  EXPECT_EQ(Keys(this->GetEdges(FilteredEdgeQuery<uint64_t>{.min_weight = 0.0F, .max_weight = 0.5F, .limit = 10})),
            (std::vector<Key>{k13b, k23a}));
  EXPECT_EQ(Keys(this->GetEdges(
                FilteredEdgeQuery<uint64_t>{.low = Timestamp(20), .high = Timestamp(40), .limit = 10})),
            (std::vector<Key>{k13b, k23a, k31a}));
  EXPECT_EQ(Keys(this->GetEdges(FilteredEdgeQuery<uint64_t>{.type = T("a"), .min_weight = 0.6F, .limit = 10})),
            (std::vector<Key>{k31a}));
}

TYPED_TEST(DatastoreTest, SpecificEdgeQuery) {
  this->CreateVertices({{1, "v"}, {2, "v"}});
  this->CreateEdge(1, "a", 2, 0.25F, 7);

  auto edges = this->GetEdges(SpecificEdgeQuery<uint64_t>{{{1, T("a"), 2}, {2, T("a"), 1}, {1, T("a"), 2}}});
  ASSERT_EQ(edges.size(), 1);
  EXPECT_EQ(edges[0].weight(), W(0.25F));
  EXPECT_EQ(edges[0].update_datetime(), Timestamp(7));
}

TYPED_TEST(DatastoreTest, DeleteEdges) {
  this->CreateVertices({{1, "v"}, {2, "v"}, {3, "v"}});
  this->CreateEdge(1, "a", 2);
  this->CreateEdge(1, "b", 2);
  this->CreateEdge(2, "a", 3);

  ASSERT_TRUE(this->datastore().DeleteEdges(FilteredEdgeQuery<uint64_t>{.type = T("a"), .limit = 10}).has_value());
  EXPECT_EQ(Keys(this->GetEdges(AllEdges())), (std::vector<EdgeKey<uint64_t>>{{1, T("b"), 2}}));
  EXPECT_EQ(this->datastore().GetEdgeCount(2, std::nullopt, EdgeDirection::Inbound), 1U);
  EXPECT_EQ(this->datastore().GetEdgeCount(3, std::nullopt, EdgeDirection::Inbound), 0U);

  ASSERT_TRUE(this->datastore().DeleteEdges(SpecificEdgeQuery<uint64_t>{{{1, T("b"), 2}}}).has_value());
  EXPECT_TRUE(this->GetEdges(AllEdges()).empty());
  // Vertices are untouched.
  EXPECT_EQ(this->datastore().GetVertexCount(), 3U);
}

TYPED_TEST(DatastoreTest, DeleteVerticesCascades) {
  this->CreateVertices({{1, "a"}, {2, "b"}, {3, "a"}});
  this->CreateEdge(1, "e", 2);
  this->CreateEdge(2, "e", 3);
  this->CreateEdge(3, "e", 1);
  this->CreateEdge(2, "e", 2);

  ASSERT_TRUE(this->datastore().DeleteVertices(RangeVertexQuery<uint64_t>{.limit = 10, .type = T("b")}).has_value());
  EXPECT_EQ(Ids(this->GetVertices(RangeVertexQuery<uint64_t>{.limit = 10})), (std::vector<uint64_t>{1, 3}));
  EXPECT_EQ(Keys(this->GetEdges(AllEdges())), (std::vector<EdgeKey<uint64_t>>{{3, T("e"), 1}}));
  EXPECT_EQ(this->datastore().GetEdgeCount(2, std::nullopt, EdgeDirection::Outbound), 0U);
  EXPECT_EQ(this->datastore().GetEdgeCount(3, std::nullopt, EdgeDirection::Inbound), 0U);

  // Type index entries go away with the vertex.
  EXPECT_TRUE(this->GetVertices(RangeVertexQuery<uint64_t>{.limit = 10, .type = T("b")}).empty());
}

TYPED_TEST(DatastoreTest, Counts) {
  EXPECT_EQ(this->datastore().GetVertexCount(), 0U);
  this->CreateVertices({{1, "v"}, {2, "v"}, {3, "v"}});
  this->CreateEdge(1, "a", 2);
  this->CreateEdge(1, "b", 2);
  this->CreateEdge(1, "a", 3);
  this->CreateEdge(3, "a", 2);

  EXPECT_EQ(this->datastore().GetVertexCount(), 3U);
  EXPECT_EQ(this->datastore().GetEdgeCount(1, std::nullopt, EdgeDirection::Outbound), 3U);
  EXPECT_EQ(this->datastore().GetEdgeCount(1, T("a"), EdgeDirection::Outbound), 2U);
  EXPECT_EQ(this->datastore().GetEdgeCount(2, std::nullopt, EdgeDirection::Inbound), 3U);
  EXPECT_EQ(this->datastore().GetEdgeCount(2, T("b"), EdgeDirection::Inbound), 1U);
  EXPECT_EQ(this->datastore().GetEdgeCount(2, std::nullopt, EdgeDirection::Outbound), 0U);
  EXPECT_EQ(this->datastore().GetEdgeCount(9, std::nullopt, EdgeDirection::Inbound), 0U);
}

TYPED_TEST(DatastoreTest, Transaction) {
  std::vector<Operation<uint64_t>> operations{
      CreateVertexOp<uint64_t>{Vertex<uint64_t>(1, T("v"))},
      CreateVertexOp<uint64_t>{Vertex<uint64_t>(2, T("v"))},
      CreateEdgeOp<uint64_t>{Edge<uint64_t>(1, T("e"), 2, W(0.5F), Timestamp(3))},
      GetEdgesOp<uint64_t>{AllEdges()},
      GetVertexCountOp{},
      GetEdgeCountOp<uint64_t>{.id = 2, .type = std::nullopt, .direction = EdgeDirection::Inbound},
      DeleteEdgesOp<uint64_t>{AllEdges()},
  };
  auto results = this->datastore().Transaction(operations);
  ASSERT_TRUE(results.has_value()) << results.error().message;
  ASSERT_EQ(results->size(), operations.size());
  EXPECT_TRUE(std::get<bool>((*results)[0]));
  EXPECT_TRUE(std::get<bool>((*results)[2]));
  // Later operations observe the earlier ones.
  EXPECT_EQ(std::get<std::vector<Edge<uint64_t>>>((*results)[3]).size(), 1);
  EXPECT_EQ(std::get<uint64_t>((*results)[4]), 2U);
  EXPECT_EQ(std::get<uint64_t>((*results)[5]), 1U);
  EXPECT_TRUE(std::holds_alternative<std::monostate>((*results)[6]));

  EXPECT_EQ(this->datastore().GetVertexCount(), 2U);
  EXPECT_TRUE(this->GetEdges(AllEdges()).empty());
}

TYPED_TEST(DatastoreTest, FailedTransactionHasNoEffect) {
  this->CreateVertices({{1, "v"}, {2, "v"}});
  this->CreateEdge(1, "e", 2, 0.5F, 10);

  std::vector<Operation<uint64_t>> operations{
      CreateVertexOp<uint64_t>{Vertex<uint64_t>(3, T("v"))},
      CreateEdgeOp<uint64_t>{Edge<uint64_t>(1, T("e"), 2, W(-0.5F), Timestamp(20))},
      DeleteVerticesOp<uint64_t>{SpecificVertexQuery<uint64_t>{{2}}},
      CreateVertexOp<uint64_t>{Vertex<uint64_t>(1, T("v"))},
  };
  auto results = this->datastore().Transaction(operations);
  ASSERT_FALSE(results.has_value());
  EXPECT_EQ(results.error().kind, ErrorKind::UuidTaken);

  EXPECT_EQ(Ids(this->GetVertices(RangeVertexQuery<uint64_t>{.limit = 10})), (std::vector<uint64_t>{1, 2}));
  auto edges = this->GetEdges(AllEdges());
  ASSERT_EQ(edges.size(), 1);
  EXPECT_EQ(edges[0].weight(), W(0.5F));
  EXPECT_EQ(edges[0].update_datetime(), Timestamp(10));
  EXPECT_EQ(this->datastore().GetEdgeCount(2, std::nullopt, EdgeDirection::Inbound), 1U);
}

TYPED_TEST(DatastoreTest, EmptyTransaction) {
  auto results = this->datastore().Transaction({});
  ASSERT_TRUE(results.has_value());
  EXPECT_TRUE(results->empty());
}

TYPED_TEST(DatastoreTest, ReturnedValuesAreCopies) {
  this->CreateVertices({{1, "v"}});
  auto vertices = this->GetVertices(SpecificVertexQuery<uint64_t>{{1}});
  ASSERT_EQ(vertices.size(), 1);
  vertices[0].set_type(T("changed"));
  EXPECT_EQ(this->GetVertices(SpecificVertexQuery<uint64_t>{{1}})[0].type(), T("v"));
}

TYPED_TEST(DatastoreTest, ConcurrentWriters) {
  constexpr uint64_t kThreads = 4;
  constexpr uint64_t kVertices = 50;
  std::vector<std::thread> threads;
  std::atomic<uint64_t> failures{0};
  for (uint64_t t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (uint64_t i = 0; i < kVertices; ++i) {
        auto created = this->datastore().CreateVertex(Vertex<uint64_t>(t * kVertices + i, T("v")));
        if (!created || !*created) ++failures;
      }
    });
  }
  for (auto &thread : threads) thread.join();
  EXPECT_EQ(failures.load(), 0U);
  EXPECT_EQ(this->datastore().GetVertexCount(), kThreads * kVertices);
}

// Identifiers other than integers go through the same key encodings.

template <typename THarness>
class StringIdDatastoreTest : public ::testing::Test {
 protected:
  THarness harness_;
};

using StringIdHarnesses = ::testing::Types<InMemoryHarness<std::string>, RocksdbHarness<std::string>,
                                           RemoteHarness<std::string>>;
TYPED_TEST_SUITE(StringIdDatastoreTest, StringIdHarnesses);

TYPED_TEST(StringIdDatastoreTest, OrderingMatchesStrings) {
  auto &datastore = this->harness_.datastore();
  std::vector<std::string> ids{"b", "a", std::string("a\0", 2), "ab", "", "a\x01"};
  for (const auto &id : ids) ASSERT_TRUE(datastore.CreateVertex(Vertex<std::string>(id, T("v"))).has_value());

  std::ranges::sort(ids);
  auto vertices = datastore.GetVertices(RangeVertexQuery<std::string>{.limit = 100});
  ASSERT_TRUE(vertices.has_value());
  std::vector<std::string> got;
  for (const auto &vertex : *vertices) got.push_back(vertex.id());
  EXPECT_EQ(got, ids);

  auto after_a = datastore.GetVertices(RangeVertexQuery<std::string>{.limit = 2, .start_id = "a"});
  ASSERT_TRUE(after_a.has_value());
  ASSERT_EQ(after_a->size(), 2);
  EXPECT_EQ((*after_a)[0].id(), std::string("a\0", 2));
  EXPECT_EQ((*after_a)[1].id(), "a\x01");
}

TYPED_TEST(StringIdDatastoreTest, EdgesBetweenPrefixIds) {
  auto &datastore = this->harness_.datastore();
  for (auto const *id : {"a", "ab", "b"}) {
    ASSERT_TRUE(datastore.CreateVertex(Vertex<std::string>(id, T("v"))).has_value());
  }
  ASSERT_TRUE(datastore.CreateEdge(Edge<std::string>("a", T("e"), "b", W(0.0F), Timestamp(1))).has_value());
  ASSERT_TRUE(datastore.CreateEdge(Edge<std::string>("ab", T("e"), "b", W(0.0F), Timestamp(1))).has_value());

  // "a" must not pick up the edges of "ab".
  EXPECT_EQ(datastore.GetEdgeCount("a", std::nullopt, EdgeDirection::Outbound), 1U);
  auto edges = datastore.GetEdges(FilteredEdgeQuery<std::string>{.outbound_id = "a", .limit = 10});
  ASSERT_TRUE(edges.has_value());
  ASSERT_EQ(edges->size(), 1);
  EXPECT_EQ((*edges)[0].inbound_id(), "b");
  EXPECT_EQ(datastore.GetEdgeCount("b", std::nullopt, EdgeDirection::Inbound), 2U);
}

TYPED_TEST(StringIdDatastoreTest, IdsThatAreNotUtf8) {
  auto &datastore = this->harness_.datastore();
  auto const binary = std::string("\xFF\0a", 3);
  auto const truncated = std::string("\xC3");
  ASSERT_TRUE(datastore.CreateVertex(Vertex<std::string>(binary, T("v"))).value_or(false));
  ASSERT_TRUE(datastore.CreateVertex(Vertex<std::string>(truncated, T("v"))).value_or(false));
  ASSERT_TRUE(
      datastore.CreateEdge(Edge<std::string>(binary, T("e"), truncated, W(0.25F), Timestamp(7))).value_or(false));

  auto vertices = datastore.GetVertices(SpecificVertexQuery<std::string>{{truncated, binary}});
  ASSERT_TRUE(vertices.has_value());
  ASSERT_EQ(vertices->size(), 2);
  EXPECT_EQ((*vertices)[0].id(), truncated);
  EXPECT_EQ((*vertices)[1].id(), binary);

  auto edges = datastore.GetEdges(FilteredEdgeQuery<std::string>{.inbound_id = truncated, .limit = 10});
  ASSERT_TRUE(edges.has_value());
  ASSERT_EQ(edges->size(), 1);
  EXPECT_EQ((*edges)[0].outbound_id(), binary);
  EXPECT_EQ((*edges)[0].inbound_id(), truncated);

  auto again = datastore.CreateVertex(Vertex<std::string>(binary, T("v")));
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().kind, ErrorKind::UuidTaken);

  ASSERT_TRUE(datastore.DeleteVertices(SpecificVertexQuery<std::string>{{binary}}).has_value());
  EXPECT_EQ(datastore.GetVertexCount(), 1U);
  EXPECT_EQ(datastore.GetEdgeCount(truncated, std::nullopt, EdgeDirection::Inbound), 0U);
}

TEST(UuidDatastore, RandomIdentifiers) {
  InMemoryDatastore<trellis::utils::UUID> datastore;
  trellis::utils::UUID id;
  ASSERT_TRUE(datastore.CreateVertex(Vertex<trellis::utils::UUID>(id, T("v"))).has_value());
  auto again = datastore.CreateVertex(Vertex<trellis::utils::UUID>(id, T("v")));
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().kind, ErrorKind::UuidTaken);

  // Starting after the last possible UUID yields nothing.
  trellis::utils::UUID::Bytes last;
  last.fill(0xFF);
  auto vertices = datastore.GetVertices(
      RangeVertexQuery<trellis::utils::UUID>{.limit = 10, .start_id = trellis::utils::UUID{last}});
  ASSERT_TRUE(vertices.has_value());
  EXPECT_TRUE(vertices->empty());
}

TEST(RocksdbDatastore, Durability) {
  auto const directory = UniqueDirectory("rocksdb_durability");
  {
    RocksdbDatastore<uint64_t> datastore(directory);
    ASSERT_TRUE(datastore.CreateVertex(Vertex<uint64_t>(1, T("v"))).has_value());
    ASSERT_TRUE(datastore.CreateVertex(Vertex<uint64_t>(2, T("v"))).has_value());
    ASSERT_TRUE(datastore.CreateEdge(Edge<uint64_t>(1, T("e"), 2, W(0.5F), Timestamp(123456789))).has_value());
  }
  {
    RocksdbDatastore<uint64_t> datastore(directory);
    EXPECT_EQ(datastore.GetVertexCount(), 2U);
    auto edges = datastore.GetEdges(SpecificEdgeQuery<uint64_t>{{{1, T("e"), 2}}});
    ASSERT_TRUE(edges.has_value());
    ASSERT_EQ(edges->size(), 1);
    EXPECT_EQ((*edges)[0].update_datetime(), Timestamp(123456789));
  }
  fs::remove_all(directory);
}

TEST(RocksdbDatastore, EdgesInOppositeDirections) {
  RocksdbHarness<uint64_t> harness;
  auto &datastore = harness.datastore();
  ASSERT_TRUE(datastore.CreateVertex(Vertex<uint64_t>(1, T("v"))).has_value());
  ASSERT_TRUE(datastore.CreateVertex(Vertex<uint64_t>(2, T("v"))).has_value());

  constexpr int kThreads = 4;
  constexpr int kEdges = 50;
  std::vector<std::thread> threads;
  std::atomic<int> failures{0};
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      auto const from = t % 2 == 0 ? uint64_t{1} : uint64_t{2};
      auto const to = t % 2 == 0 ? uint64_t{2} : uint64_t{1};
      for (int i = 0; i < kEdges; ++i) {
        auto created = datastore.CreateEdge(Edge<uint64_t>(from, T(fmt::format("e{}", t)), to, W(0.5F), Timestamp(i)));
        if (!created || !*created) ++failures;
      }
    });
  }
  for (auto &thread : threads) thread.join();
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(datastore.GetEdgeCount(1, std::nullopt, EdgeDirection::Outbound), 2U);
  EXPECT_EQ(datastore.GetEdgeCount(2, std::nullopt, EdgeDirection::Outbound), 2U);
}

TEST(RocksdbDatastore, DeleteVertexRacingCreateEdge) {
  RocksdbHarness<uint64_t> harness;
  auto &datastore = harness.datastore();
  constexpr uint64_t kRounds = 100;
  for (uint64_t round = 0; round < kRounds; ++round) {
    auto const from = 2 * round;
    auto const to = 2 * round + 1;
    ASSERT_TRUE(datastore.CreateVertex(Vertex<uint64_t>(from, T("v"))).has_value());
    ASSERT_TRUE(datastore.CreateVertex(Vertex<uint64_t>(to, T("v"))).has_value());

    std::atomic<bool> deleted{false};
    std::atomic<bool> created{false};
    std::thread deleter([&] { deleted = datastore.DeleteVertices(SpecificVertexQuery<uint64_t>{{to}}).has_value(); });
    std::thread creator([&] {
      created = datastore.CreateEdge(Edge<uint64_t>(from, T("e"), to, W(0.5F), Timestamp(1))).has_value();
    });
    deleter.join();
    creator.join();
    EXPECT_TRUE(deleted.load());
    EXPECT_TRUE(created.load());
  }

  auto edges = datastore.GetEdges(FilteredEdgeQuery<uint64_t>{.limit = std::numeric_limits<uint32_t>::max()});
  ASSERT_TRUE(edges.has_value());
  for (const auto &edge : *edges) {
    auto endpoints = datastore.GetVertices(SpecificVertexQuery<uint64_t>{{edge.outbound_id(), edge.inbound_id()}});
    ASSERT_TRUE(endpoints.has_value());
    EXPECT_EQ(endpoints->size(), 2) << "edge " << edge.outbound_id() << " -> " << edge.inbound_id();
  }
}

TEST(ClientDatastore, UnreachableServerIsBackendStorage) {
  ClientDatastore<uint64_t> datastore(trellis::io::network::Endpoint("127.0.0.1", 1));
  auto count = datastore.GetVertexCount();
  ASSERT_FALSE(count.has_value());
  EXPECT_EQ(count.error().kind, ErrorKind::BackendStorage);
}

TEST(ClientDatastore, SilentServerIsBackendStorage) {
  trellis::io::network::Socket listener;
  ASSERT_TRUE(listener.Bind(trellis::io::network::Endpoint("127.0.0.1", 0)));
  ASSERT_TRUE(listener.Listen(4));

  // The kernel completes the handshake, nobody ever answers.
  ClientDatastore<uint64_t> datastore(listener.endpoint(), std::chrono::milliseconds(100));
  auto count = datastore.GetVertexCount();
  ASSERT_FALSE(count.has_value());
  EXPECT_EQ(count.error().kind, ErrorKind::BackendStorage);
}
