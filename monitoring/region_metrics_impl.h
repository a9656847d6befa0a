//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "monitoring/fill_factor_provider.h"
#include "monitoring/hit_rate_metrics.h"
#include "pagepool/options.h"
#include "pagepool/region_metrics.h"
#include "pagepool/system_clock.h"

namespace PAGEPOOL_NAMESPACE {

class RegionMetricsImpl : public RegionMetrics {
 public:
  RegionMetricsImpl(const RegionOptions& options,
                    std::unique_ptr<FillFactorProvider> fill_factor,
                    SystemClock* clock);

  const std::string& GetName() const override { return name_; }

  uint64_t GetTotalAllocatedPages() const override;

  double GetAllocationRate() const override;

  double GetEvictionRate() const override;

  double GetPagesFillFactor() const override;

  bool IsEnabled() const override {
    return enabled_.load(std::memory_order_relaxed);
  }

  void EnableMetrics() override { enabled_.store(true); }

  void DisableMetrics() override { enabled_.store(false); }

  Status SetRateTimeInterval(int64_t rate_time_interval_ms) override;

  Status SetSubIntervals(int sub_intervals) override;

  RegionMetricsSnapshot GetSnapshot() const override;

  // Called by page memory. A positive delta also counts as allocations.
  void UpdateTotalAllocatedPages(int64_t delta);

  // Called by eviction trackers for every evicted page.
  void IncrementEvictionRate();

 private:
  const std::string name_;
  std::unique_ptr<FillFactorProvider> fill_factor_;
  std::atomic<bool> enabled_;
  std::atomic<int64_t> total_allocated_pages_;
  // HitRateMetrics is internally synchronized; the getters are logically
  // const.
  mutable HitRateMetrics allocation_rate_;
  mutable HitRateMetrics eviction_rate_;
};

}  // namespace PAGEPOOL_NAMESPACE
