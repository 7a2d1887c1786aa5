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

#include <gtest/gtest.h>

#include "flags/general.hpp"
#include "flags/log_level.hpp"

using trellis::flags::IdType;

TEST(Flags, IdTypes) {
  EXPECT_TRUE(trellis::flags::ValidIdType("uuid"));
  EXPECT_TRUE(trellis::flags::ValidIdType("uint"));
  EXPECT_TRUE(trellis::flags::ValidIdType("string"));
  EXPECT_FALSE(trellis::flags::ValidIdType("UUID"));
  EXPECT_FALSE(trellis::flags::ValidIdType(""));

  EXPECT_EQ(trellis::flags::ParseIdType("uuid"), IdType::Uuid);
  EXPECT_EQ(trellis::flags::ParseIdType("uint"), IdType::Uint);
  EXPECT_EQ(trellis::flags::ParseIdType("string"), IdType::String);
}

TEST(Flags, LogLevels) {
  EXPECT_EQ(trellis::flags::LogLevelToEnum("TRACE"), spdlog::level::trace);
  EXPECT_EQ(trellis::flags::LogLevelToEnum("warning"), spdlog::level::warn);
  EXPECT_EQ(trellis::flags::LogLevelToEnum("Critical"), spdlog::level::critical);
  EXPECT_FALSE(trellis::flags::LogLevelToEnum("verbose").has_value());

  EXPECT_TRUE(trellis::flags::ValidLogLevel("info"));
  EXPECT_FALSE(trellis::flags::ValidLogLevel("loud"));
}

TEST(Flags, Defaults) {
  EXPECT_EQ(FLAGS_datastore, "memory://");
  EXPECT_EQ(FLAGS_bind_address, "127.0.0.1:27615");
  EXPECT_EQ(FLAGS_id_type, "uuid");
  EXPECT_GE(FLAGS_workers, 1);
  EXPECT_LE(FLAGS_workers, 1024);
}
