// Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <assert.h>

#include <atomic>
#include <limits>

#include "pagepool/system_clock.h"

namespace PAGEPOOL_NAMESPACE {

// A clock that only moves when told to. Page access timestamps and rate
// windows read it, so tests can order touches and expire buckets exactly.
class MockSystemClock : public SystemClockWrapper {
 public:
  explicit MockSystemClock(const std::shared_ptr<SystemClock>& base)
      : SystemClockWrapper(base) {}

  static const char* kClassName() { return "MockSystemClock"; }
  const char* Name() const override { return kClassName(); }

  uint64_t NowSeconds() { return current_time_us_ / kMicrosInSecond; }

  uint64_t NowMicros() override { return current_time_us_; }

  uint64_t NowNanos() override {
    assert(current_time_us_ <= std::numeric_limits<uint64_t>::max() / 1000);
    return current_time_us_ * 1000;
  }

  uint64_t RealNowMicros() { return target_->NowMicros(); }

  void SetCurrentTime(uint64_t time_sec) {
    assert(time_sec < std::numeric_limits<uint64_t>::max() / kMicrosInSecond);
    assert(time_sec * kMicrosInSecond >= current_time_us_);
    current_time_us_ = time_sec * kMicrosInSecond;
  }

  // It's a fake sleep that just advances the current time.
  // Note: Not thread safe.
  void SleepForMicroseconds(int micros) override {
    assert(micros >= 0);
    current_time_us_.fetch_add(micros);
  }

  void MockSleepForMilliseconds(int millis) {
    assert(millis >= 0);
    current_time_us_.fetch_add(static_cast<uint64_t>(millis) * 1000);
  }

 private:
  std::atomic<uint64_t> current_time_us_{0};
  static constexpr uint64_t kMicrosInSecond = 1000U * 1000U;
};

}  // namespace PAGEPOOL_NAMESPACE
