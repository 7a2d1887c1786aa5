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

#include <csignal>
#include <functional>
#include <map>

namespace trellis::utils {

enum class Signal : int {
  Terminate = SIGTERM,
  Interrupt = SIGINT,
  Pipe = SIGPIPE,
};

/// Ignores `signal` in every thread of the process.
bool SignalIgnore(Signal signal);

/// Process wide registry of signal callbacks. Callbacks run inside the
/// signal handler and must only do async signal safe work.
class SignalHandler {
 public:
  /// Installs `func` for `signal`. Signals in `blocked` are masked while
  /// `func` runs.
  static bool RegisterHandler(Signal signal, std::function<void()> func, const sigset_t &blocked);
  static bool RegisterHandler(Signal signal, std::function<void()> func);

 private:
  static void Handle(int signal);

  static std::map<int, std::function<void()>> handlers_;
};

}  // namespace trellis::utils
