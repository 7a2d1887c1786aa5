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

#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <ostream>
#include <string>

#include <fmt/format.h>

#include "utils/exceptions.hpp"

namespace trellis::utils {

class TimestampError : public BasicException {
 public:
  using BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(TimestampError)
};

/// UTC point in time with nanosecond resolution. The value is kept as the
/// number of nanoseconds since the Unix epoch so it survives any round trip
/// through an integer without loss.
class Timestamp final {
 public:
  Timestamp() = default;

  explicit Timestamp(int64_t nanoseconds_since_epoch) : nsec_since_epoch_(nanoseconds_since_epoch) {}

  Timestamp(std::time_t time, long nsec) : nsec_since_epoch_(static_cast<int64_t>(time) * kNsecPerSec + nsec) {}

  static Timestamp Now() {
    timespec time{};
    clock_gettime(CLOCK_REALTIME, &time);
    return {time.tv_sec, time.tv_nsec};
  }

  int64_t NanoSecSinceTheEpoch() const { return nsec_since_epoch_; }

  std::time_t SecSinceTheEpoch() const { return static_cast<std::time_t>(FloorDiv(nsec_since_epoch_, kNsecPerSec)); }

  long NanoSec() const { return static_cast<long>(nsec_since_epoch_ - FloorDiv(nsec_since_epoch_, kNsecPerSec) * kNsecPerSec); }

  std::string ToIso8601() const {
    auto const unix_time = SecSinceTheEpoch();
    std::tm time{};
    if (gmtime_r(&unix_time, &time) == nullptr) throw TimestampError("Unable to convert {} to UTC", unix_time);
    return fmt::format(kIso8601, time.tm_year + 1900, time.tm_mon + 1, time.tm_mday, time.tm_hour, time.tm_min,
                       time.tm_sec, NanoSec());
  }

  friend std::ostream &operator<<(std::ostream &stream, const Timestamp &ts) { return stream << ts.ToIso8601(); }

  friend auto operator<=>(const Timestamp &, const Timestamp &) = default;

 private:
  static constexpr int64_t kNsecPerSec = 1'000'000'000;
  static constexpr auto kIso8601 = "{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:09d}Z";

  static constexpr int64_t FloorDiv(int64_t a, int64_t b) { return a / b - ((a % b != 0) && ((a < 0) != (b < 0))); }

  int64_t nsec_since_epoch_{0};
};

}  // namespace trellis::utils
