//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stdint.h>

#include <memory>

#include "pagepool/pagepool_namespace.h"

namespace PAGEPOOL_NAMESPACE {

// A SystemClock is an interface used by the library to obtain the time.
// Eviction trackers stamp pages with NowMicros() and the rate metrics slice
// their windows by it, so tests substitute a mock clock to make both
// deterministic.
class SystemClock {
 public:
  virtual ~SystemClock() {}

  static const char* Type() { return "SystemClock"; }

  // The name of this clock implementation
  virtual const char* Name() const = 0;

  // Return a default SystemClock suitable for the current operating
  // system.
  static const std::shared_ptr<SystemClock>& Default();

  // Returns the number of micro-seconds since some fixed point in time.
  // It is often used as system time such as in GenericRateLimiter
  // and other places so a port needs to return system time in order to work.
  virtual uint64_t NowMicros() = 0;

  // Returns the number of nano-seconds since some fixed point in time. Only
  // useful for computing deltas of time in one run.
  // Default implementation simply relies on NowMicros.
  // In platform-specific implementations, NowNanos() should return time points
  // that are MONOTONIC.
  virtual uint64_t NowNanos() { return NowMicros() * 1000; }

  // Sleep/delay the thread for the prescribed number of micro-seconds.
  virtual void SleepForMicroseconds(int micros) = 0;
};

// Wrapper class for a SystemClock.  Redirects all methods (except Name)
// of the SystemClock interface to the target/wrapped class.
class SystemClockWrapper : public SystemClock {
 public:
  explicit SystemClockWrapper(const std::shared_ptr<SystemClock>& t)
      : target_(t) {}

  uint64_t NowMicros() override { return target_->NowMicros(); }

  uint64_t NowNanos() override { return target_->NowNanos(); }

  void SleepForMicroseconds(int micros) override {
    return target_->SleepForMicroseconds(micros);
  }

 protected:
  std::shared_ptr<SystemClock> target_;
};

}  // namespace PAGEPOOL_NAMESPACE
