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

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "communication/exceptions.hpp"
#include "communication/session.hpp"
#include "io/network/epoll.hpp"
#include "io/network/socket.hpp"
#include "utils/logging.hpp"
#include "utils/thread.hpp"

namespace trellis::communication {

/**
 * Owns the accepted connections and serves them with a fixed pool of worker
 * threads waiting on a shared epoll instance.
 *
 * Sockets are registered edge triggered and one shot. The worker that
 * receives an event owns the session until it rearms the socket, so a session
 * never runs on two threads at once and may be destroyed by that worker.
 * A session that throws, or whose peer hangs up, is closed.
 */
template <class TSession, class TSessionData>
class Listener final {
  using SessionHandler = Session<TSession, TSessionData>;

  static constexpr uint32_t kSessionEvents = EPOLLIN | EPOLLET | EPOLLRDHUP | EPOLLONESHOT;
  static constexpr int kWaitTimeoutMs = 200;

 public:
  Listener(TSessionData *data, std::string service_name, size_t workers_count)
      : data_(data), service_name_(std::move(service_name)), workers_count_(workers_count) {}

  ~Listener() {
    TR_ASSERT(!alive_ && std::ranges::none_of(workers_, [](const auto &worker) { return worker.joinable(); }),
              "Shutdown and AwaitShutdown must be called before the {} listener is destroyed", service_name_);
  }

  Listener(const Listener &) = delete;
  Listener(Listener &&) = delete;
  Listener &operator=(const Listener &) = delete;
  Listener &operator=(Listener &&) = delete;

  void AddConnection(io::network::Socket &&connection) {
    auto guard = std::lock_guard{lock_};
    auto const fd = connection.fd();
    auto &session = sessions_.emplace_back(std::make_unique<SessionHandler>(std::move(connection), data_));
    epoll_.Add(fd, kSessionEvents, session.get());
  }

  void Start() {
    TR_ASSERT(!alive_, "The {} listener is already running", service_name_);
    alive_ = true;
    spdlog::info("Starting {} {} workers", workers_count_, service_name_);
    workers_.reserve(workers_count_);
    for (size_t i = 0; i < workers_count_; ++i) {
      workers_.emplace_back([this, i] {
        utils::ThreadSetName(fmt::format("{} worker {}", service_name_, i + 1));
        while (alive_) ServeNextEvent();
      });
    }
  }

  void Shutdown() { alive_ = false; }

  /// Joins the workers and closes every remaining connection.
  void AwaitShutdown() {
    for (auto &worker : workers_) {
      if (worker.joinable()) worker.join();
    }
    auto guard = std::lock_guard{lock_};
    sessions_.clear();
  }

 private:
  void ServeNextEvent() {
    io::network::Epoll::Event event;
    if (epoll_.Wait(&event, 1, kWaitTimeoutMs) <= 0) return;

    auto &session = *static_cast<SessionHandler *>(event.data.ptr);
    if (event.events & EPOLLIN) {
      Drain(session);
      return;
    }
    if (event.events & EPOLLRDHUP) {
      spdlog::debug("{} client {} hung up", service_name_, session.socket().endpoint());
    } else {
      spdlog::warn("{} connection with {} failed, events {:#x}", service_name_, session.socket().endpoint(),
                   uint32_t{event.events});
    }
    Close(session);
  }

  /// Executes the session until the socket has no more data, then rearms it.
  void Drain(SessionHandler &session) {
    try {
      while (!session.Execute()) {
      }
    } catch (const SessionClosedException &) {
      spdlog::debug("{} client {} closed the connection", service_name_, session.socket().endpoint());
      Close(session);
      return;
    } catch (const std::exception &e) {
      spdlog::warn("Closing {} connection with {}: {}", service_name_, session.socket().endpoint(), e.what());
      Close(session);
      return;
    }
    epoll_.Modify(session.socket().fd(), kSessionEvents, &session);
  }

  void Close(SessionHandler &session) {
    // Deregister first, epoll keeps closed descriptors that have duplicates.
    epoll_.Delete(session.socket().fd());
    auto guard = std::lock_guard{lock_};
    auto it = std::ranges::find_if(sessions_, [&session](const auto &owned) { return owned.get() == &session; });
    TR_ASSERT(it != sessions_.end(), "Closing a session the {} listener doesn't own", service_name_);
    std::swap(*it, sessions_.back());
    sessions_.pop_back();
  }

  io::network::Epoll epoll_;
  TSessionData *data_;

  std::mutex lock_;
  std::vector<std::unique_ptr<SessionHandler>> sessions_;

  std::vector<std::thread> workers_;
  std::atomic<bool> alive_{false};

  const std::string service_name_;
  const size_t workers_count_;
};

}  // namespace trellis::communication
