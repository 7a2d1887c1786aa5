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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "communication/client.hpp"
#include "io/network/endpoint.hpp"
#include "io/network/socket.hpp"
#include "rpc/client.hpp"
#include "rpc/exceptions.hpp"
#include "rpc/messages.hpp"
#include "rpc/protocol.hpp"
#include "rpc/server.hpp"
#include "storage/error.hpp"

using trellis::io::network::Endpoint;
using trellis::rpc::Client;
using trellis::rpc::Server;

namespace {

nlohmann::json Echo(const nlohmann::json &request) { return trellis::rpc::OkResponse(request["value"]); }

// Sends one raw frame and returns the decoded response.
nlohmann::json SendRaw(trellis::communication::Client *client, std::string_view payload) {
  EXPECT_TRUE(client->Write(trellis::rpc::EncodeFrame(payload)));
  EXPECT_TRUE(client->Receive(trellis::rpc::kFrameHeaderSize));
  auto const size = trellis::rpc::DecodeFrameSize(client->Received().data());
  client->Consume(trellis::rpc::kFrameHeaderSize);
  EXPECT_TRUE(client->Receive(size));
  auto const body = client->Received().first(size);
  auto response = nlohmann::json::parse(body.begin(), body.end());
  client->Consume(size);
  return response;
}

}  // namespace

class RpcTest : public ::testing::Test {
 protected:
  void SetUp() override {
    server_.Register("echo", Echo);
    server_.Register("fail", [](const nlohmann::json &) {
      return trellis::rpc::ErrorResponse(trellis::storage::Error::BackendStorage("disk on fire"));
    });
    ASSERT_TRUE(server_.Start());
  }

  void TearDown() override {
    server_.Shutdown();
    server_.AwaitShutdown();
  }

  Server server_{Endpoint("127.0.0.1", 0), 2};
};

TEST_F(RpcTest, Call) {
  Client client(server_.endpoint());
  auto response = client.Call({{"type", "echo"}, {"value", "hello"}});
  auto result = trellis::rpc::UnwrapResponse(response, "result");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, "hello");

  // The connection is reused.
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(client.Call({{"type", "echo"}, {"value", i}})["result"], i);
  }
}

TEST_F(RpcTest, ErrorResponse) {
  Client client(server_.endpoint());
  auto result = trellis::rpc::UnwrapResponse(client.Call({{"type", "fail"}}), "result");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, trellis::storage::ErrorKind::BackendStorage);
  EXPECT_EQ(result.error().message, "disk on fire");
}

TEST_F(RpcTest, LargeMessage) {
  Client client(server_.endpoint());
  std::string value(3 * 1024 * 1024, 'x');
  EXPECT_EQ(client.Call({{"type", "echo"}, {"value", value}})["result"], value);
}

TEST_F(RpcTest, MalformedRequestClosesOnlyItsConnection) {
  Client healthy(server_.endpoint());
  ASSERT_EQ(healthy.Call({{"type", "echo"}, {"value", 1}})["result"], 1);

  trellis::communication::Client raw;
  ASSERT_TRUE(raw.Connect(server_.endpoint()));
  auto response = SendRaw(&raw, "{not json");
  EXPECT_EQ(response["status"], "error");
  EXPECT_EQ(response["error"]["kind"], "serialization");

  // The server hangs up after answering.
  EXPECT_FALSE(raw.Receive(1));

  EXPECT_EQ(healthy.Call({{"type", "echo"}, {"value", 2}})["result"], 2);
}

TEST_F(RpcTest, UnknownTypeIsMalformed) {
  trellis::communication::Client raw;
  ASSERT_TRUE(raw.Connect(server_.endpoint()));
  auto response = SendRaw(&raw, R"({"type": "teleport"})");
  EXPECT_EQ(response["error"]["kind"], "serialization");
  EXPECT_FALSE(raw.Receive(1));
}

TEST_F(RpcTest, OversizedFrameIsRejected) {
  trellis::communication::Client raw;
  ASSERT_TRUE(raw.Connect(server_.endpoint()));
  // Only the header is sent, announcing more than the limit.
  uint8_t header[] = {0xFF, 0xFF, 0xFF, 0xFF};
  ASSERT_TRUE(raw.Write(std::span<const uint8_t>{header}));
  ASSERT_TRUE(raw.Receive(trellis::rpc::kFrameHeaderSize));
  auto const size = trellis::rpc::DecodeFrameSize(raw.Received().data());
  raw.Consume(trellis::rpc::kFrameHeaderSize);
  ASSERT_TRUE(raw.Receive(size));
  auto const body = raw.Received().first(size);
  EXPECT_EQ(nlohmann::json::parse(body.begin(), body.end())["status"], "error");
  raw.Consume(size);
  EXPECT_FALSE(raw.Receive(1));
}

TEST_F(RpcTest, ConcurrentClients) {
  constexpr int kThreads = 4;
  constexpr int kCalls = 50;
  std::atomic<int> successes{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      Client client(server_.endpoint());
      for (int i = 0; i < kCalls; ++i) {
        auto const value = t * kCalls + i;
        if (client.Call({{"type", "echo"}, {"value", value}})["result"] == value) ++successes;
      }
    });
  }
  for (auto &thread : threads) thread.join();
  EXPECT_EQ(successes.load(), kThreads * kCalls);
}

TEST(RpcClient, UnreachableServer) {
  // Nothing listens on port 1 of the loopback.
  Client client(Endpoint("127.0.0.1", 1));
  EXPECT_THROW(client.Call({{"type", "echo"}}), trellis::rpc::RpcFailedException);
  // A failed call doesn't poison the next one.
  EXPECT_THROW(client.Call({{"type", "echo"}}), trellis::rpc::RpcFailedException);
}

TEST(RpcClient, SilentServerTimesOut) {
  // Accepts the connection but never reads or answers.
  trellis::io::network::Socket listener;
  ASSERT_TRUE(listener.Bind(Endpoint("127.0.0.1", 0)));
  ASSERT_TRUE(listener.Listen(4));
  std::optional<trellis::io::network::Socket> accepted;
  std::thread acceptor([&] { accepted = listener.Accept(); });

  Client client(listener.endpoint(), std::chrono::milliseconds(200));
  auto const start = std::chrono::steady_clock::now();
  EXPECT_THROW(client.Call({{"type", "echo"}, {"value", 1}}), trellis::rpc::RpcFailedException);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  acceptor.join();
  EXPECT_TRUE(accepted.has_value());
}

TEST(RpcFrame, HeaderIsBigEndian) {
  auto frame = trellis::rpc::EncodeFrame(std::string(258, 'a'));
  ASSERT_EQ(frame.size(), 262U);
  EXPECT_EQ(frame.substr(0, 4), std::string("\x00\x00\x01\x02", 4));
  EXPECT_EQ(trellis::rpc::DecodeFrameSize(reinterpret_cast<const uint8_t *>(frame.data())), 258U);
}
