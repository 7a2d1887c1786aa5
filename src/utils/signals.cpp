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

#include "utils/signals.hpp"

#include <utility>

namespace trellis::utils {

namespace {

bool InstallAction(int signal_number, void (*handler)(int), const sigset_t &blocked, int flags) {
  struct sigaction action {};
  // `sa_sigaction` and `sa_handler` may share storage.
  action.sa_sigaction = nullptr;
  action.sa_handler = handler;
  action.sa_mask = blocked;
  action.sa_flags = flags;
  return sigaction(signal_number, &action, nullptr) == 0;
}

}  // namespace

std::map<int, std::function<void()>> SignalHandler::handlers_;

bool SignalIgnore(Signal signal) {
  sigset_t empty;
  sigemptyset(&empty);
  return InstallAction(static_cast<int>(signal), SIG_IGN, empty, 0);
}

void SignalHandler::Handle(int signal) {
  auto it = handlers_.find(signal);
  if (it != handlers_.end()) it->second();
}

bool SignalHandler::RegisterHandler(Signal signal, std::function<void()> func, const sigset_t &blocked) {
  auto const signal_number = static_cast<int>(signal);
  handlers_[signal_number] = std::move(func);
  return InstallAction(signal_number, &SignalHandler::Handle, blocked, SA_RESTART);
}

bool SignalHandler::RegisterHandler(Signal signal, std::function<void()> func) {
  sigset_t empty;
  sigemptyset(&empty);
  return RegisterHandler(signal, std::move(func), empty);
}

}  // namespace trellis::utils
