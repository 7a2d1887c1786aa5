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

#include <csignal>
#include <cstdlib>
#include <exception>
#include <functional>
#include <string>
#include <variant>

#include <gflags/gflags.h>

#include "flags/general.hpp"
#include "flags/log_level.hpp"
#include "io/network/endpoint.hpp"
#include "kvstore/kvstore.hpp"
#include "rpc/datastore_rpcs.hpp"
#include "rpc/server.hpp"
#include "storage/config.hpp"
#include "storage/id.hpp"
#include "utils/logging.hpp"
#include "utils/signals.hpp"
#include "utils/uuid.hpp"

namespace {

constexpr uint16_t kDefaultPort = 27615;

// Set by the first shutdown signal, a second one is ignored.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t is_shutting_down = 0;

void InitSignalHandlers(const std::function<void()> &shutdown_fun) {
  // SIGINT and SIGTERM must not interrupt each other's handler.
  sigset_t block_shutdown_signals;
  sigemptyset(&block_shutdown_signals);
  sigaddset(&block_shutdown_signals, SIGTERM);
  sigaddset(&block_shutdown_signals, SIGINT);

  auto shutdown = [shutdown_fun]() {
    if (is_shutting_down) return;
    is_shutting_down = 1;
    shutdown_fun();
  };

  TR_ASSERT(trellis::utils::SignalHandler::RegisterHandler(trellis::utils::Signal::Terminate, shutdown,
                                                           block_shutdown_signals),
            "Unable to register SIGTERM handler!");
  TR_ASSERT(trellis::utils::SignalHandler::RegisterHandler(trellis::utils::Signal::Interrupt, shutdown,
                                                           block_shutdown_signals),
            "Unable to register SIGINT handler!");
}

template <trellis::storage::Identifier Id>
int Serve(const trellis::storage::Config &config, const trellis::io::network::Endpoint &endpoint) {
  trellis::storage::AnyDatastore<Id> datastore;
  try {
    datastore = trellis::storage::MakeDatastore<Id>(config);
  } catch (const trellis::kvstore::KVStoreError &e) {
    spdlog::critical("Couldn't open the datastore: {}", e.what());
    return EXIT_FAILURE;
  }

  return std::visit(
      [&](auto &backend) {
        trellis::rpc::Server server(endpoint, FLAGS_workers);
        trellis::rpc::RegisterDatastoreRpcs(&server, backend.get());

        InitSignalHandlers([&server] {
          spdlog::info("Shutting down...");
          server.Shutdown();
        });

        if (!server.Start()) {
          spdlog::critical("Couldn't start the server on {}", endpoint);
          return EXIT_FAILURE;
        }
        spdlog::info("Serving the {} datastore on {}", trellis::storage::BackendToString(config.backend),
                     server.endpoint());
        server.AwaitShutdown();
        return EXIT_SUCCESS;
      },
      datastore);
}

}  // namespace

int main(int argc, char **argv) {
  google::SetUsageMessage("Trellis graph datastore server");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  trellis::flags::InitializeLogger();

  // Broken connections are reported by the socket calls.
  TR_ASSERT(trellis::utils::SignalIgnore(trellis::utils::Signal::Pipe), "Unable to ignore SIGPIPE!");

  trellis::storage::Config config;
  try {
    config = trellis::storage::Config::FromUri(FLAGS_datastore);
  } catch (const trellis::storage::ConfigException &e) {
    spdlog::critical("{}", e.what());
    return EXIT_FAILURE;
  }

  auto const endpoint = trellis::io::network::Endpoint::ParseSocketOrAddress(FLAGS_bind_address, kDefaultPort);
  if (!endpoint) {
    spdlog::critical("Invalid bind address '{}'", FLAGS_bind_address);
    return EXIT_FAILURE;
  }

  switch (trellis::flags::ParseIdType(FLAGS_id_type)) {
    case trellis::flags::IdType::Uuid:
      return Serve<trellis::utils::UUID>(config, *endpoint);
    case trellis::flags::IdType::Uint:
      return Serve<uint64_t>(config, *endpoint);
    case trellis::flags::IdType::String:
      return Serve<std::string>(config, *endpoint);
  }
  return EXIT_FAILURE;
}
