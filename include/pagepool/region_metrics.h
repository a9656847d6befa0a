//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stdint.h>

#include <string>

#include "pagepool/pagepool_namespace.h"
#include "pagepool/status.h"

namespace PAGEPOOL_NAMESPACE {

// A point-in-time copy of the metrics of one region.
struct RegionMetricsSnapshot {
  std::string name;
  uint64_t total_allocated_pages = 0;
  // Events per second over the rate window.
  double allocation_rate = 0.0;
  double eviction_rate = 0.0;
  // Used bytes over capacity of the non-empty data pages, in [0, 1].
  double pages_fill_factor = 0.0;
  bool metrics_enabled = false;

  std::string ToString() const;
};

// Live counters of a region. Counters only move while metrics are enabled.
class RegionMetrics {
 public:
  virtual ~RegionMetrics() {}

  virtual const std::string& GetName() const = 0;

  virtual uint64_t GetTotalAllocatedPages() const = 0;

  virtual double GetAllocationRate() const = 0;

  virtual double GetEvictionRate() const = 0;

  virtual double GetPagesFillFactor() const = 0;

  virtual bool IsEnabled() const = 0;

  virtual void EnableMetrics() = 0;

  virtual void DisableMetrics() = 0;

  // Changing the window discards the events collected so far.
  virtual Status SetRateTimeInterval(int64_t rate_time_interval_ms) = 0;

  virtual Status SetSubIntervals(int sub_intervals) = 0;

  virtual RegionMetricsSnapshot GetSnapshot() const = 0;
};

}  // namespace PAGEPOOL_NAMESPACE
