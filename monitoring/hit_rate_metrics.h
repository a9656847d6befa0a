//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stdint.h>

#include <vector>

#include "pagepool/system_clock.h"
#include "port/port.h"

namespace PAGEPOOL_NAMESPACE {

// Counts events over a sliding window of `rate_time_interval_ms`, kept as
// `sub_intervals` buckets. A bucket is cleared when the window moves past
// it, so the count covers between (sub_intervals - 1) and sub_intervals
// bucket lengths of history.
class HitRateMetrics {
 public:
  HitRateMetrics(SystemClock* clock, int64_t rate_time_interval_ms,
                 int sub_intervals);

  void OnHit() { OnHits(1); }
  void OnHits(uint64_t hits);

  // Number of events inside the window.
  uint64_t GetRate();

  // Events per second inside the window.
  double GetRatePerSecond();

  // Replaces the window shape and drops all events.
  void Reset(int64_t rate_time_interval_ms, int sub_intervals);

  // Change one dimension of the window, keeping the other, and drop all
  // events.
  void ResetRateTimeInterval(int64_t rate_time_interval_ms);
  void ResetSubIntervals(int sub_intervals);

  int64_t rate_time_interval_ms() const;
  int sub_intervals() const;

 private:
  // REQUIRES: mu_ held
  void ResetLocked(int64_t rate_time_interval_ms, int sub_intervals);
  // REQUIRES: mu_ held
  void Roll(uint64_t slot);
  uint64_t CurrentSlot() const;

  SystemClock* clock_;
  mutable port::Mutex mu_;
  int64_t rate_time_interval_ms_;
  int sub_intervals_;
  uint64_t bucket_micros_;
  uint64_t last_slot_;
  std::vector<uint64_t> buckets_;
};

}  // namespace PAGEPOOL_NAMESPACE
