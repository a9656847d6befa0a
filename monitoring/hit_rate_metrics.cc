//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "monitoring/hit_rate_metrics.h"

#include <algorithm>
#include <cassert>

#include "util/mutexlock.h"

namespace PAGEPOOL_NAMESPACE {

HitRateMetrics::HitRateMetrics(SystemClock* clock,
                               int64_t rate_time_interval_ms,
                               int sub_intervals)
    : clock_(clock) {
  Reset(rate_time_interval_ms, sub_intervals);
}

uint64_t HitRateMetrics::CurrentSlot() const {
  return clock_->NowMicros() / bucket_micros_;
}

void HitRateMetrics::Roll(uint64_t slot) {
  mu_.AssertHeld();
  if (slot <= last_slot_) {
    return;
  }
  uint64_t expired =
      std::min<uint64_t>(slot - last_slot_, buckets_.size());
  for (uint64_t i = 1; i <= expired; ++i) {
    buckets_[(last_slot_ + i) % buckets_.size()] = 0;
  }
  last_slot_ = slot;
}

void HitRateMetrics::OnHits(uint64_t hits) {
  MutexLock l(&mu_);
  uint64_t slot = CurrentSlot();
  Roll(slot);
  buckets_[slot % buckets_.size()] += hits;
}

uint64_t HitRateMetrics::GetRate() {
  MutexLock l(&mu_);
  Roll(CurrentSlot());
  uint64_t sum = 0;
  for (uint64_t b : buckets_) {
    sum += b;
  }
  return sum;
}

double HitRateMetrics::GetRatePerSecond() {
  int64_t interval_ms;
  {
    MutexLock l(&mu_);
    interval_ms = rate_time_interval_ms_;
  }
  return static_cast<double>(GetRate()) * 1000.0 /
         static_cast<double>(interval_ms);
}

void HitRateMetrics::Reset(int64_t rate_time_interval_ms, int sub_intervals) {
  MutexLock l(&mu_);
  ResetLocked(rate_time_interval_ms, sub_intervals);
}

void HitRateMetrics::ResetRateTimeInterval(int64_t rate_time_interval_ms) {
  MutexLock l(&mu_);
  ResetLocked(rate_time_interval_ms, sub_intervals_);
}

void HitRateMetrics::ResetSubIntervals(int sub_intervals) {
  MutexLock l(&mu_);
  ResetLocked(rate_time_interval_ms_, sub_intervals);
}

int64_t HitRateMetrics::rate_time_interval_ms() const {
  MutexLock l(&mu_);
  return rate_time_interval_ms_;
}

int HitRateMetrics::sub_intervals() const {
  MutexLock l(&mu_);
  return sub_intervals_;
}

void HitRateMetrics::ResetLocked(int64_t rate_time_interval_ms,
                                 int sub_intervals) {
  mu_.AssertHeld();
  assert(rate_time_interval_ms > 0);
  assert(sub_intervals > 0);
  rate_time_interval_ms_ = rate_time_interval_ms;
  sub_intervals_ = sub_intervals;
  bucket_micros_ = std::max<uint64_t>(
      1, static_cast<uint64_t>(rate_time_interval_ms) * 1000 /
             static_cast<uint64_t>(sub_intervals));
  buckets_.assign(static_cast<size_t>(sub_intervals), 0);
  last_slot_ = CurrentSlot();
}

}  // namespace PAGEPOOL_NAMESPACE
