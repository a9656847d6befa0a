//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "monitoring/region_metrics_impl.h"

#include <cinttypes>
#include <cstdio>

#include "util/string_util.h"

namespace PAGEPOOL_NAMESPACE {

std::string RegionMetricsSnapshot::ToString() const {
  char buf[256];
  snprintf(buf, sizeof(buf),
           "RegionMetrics [name=%s, enabled=%d, total_allocated_pages=%" PRIu64
           ", allocation_rate=%.2f/s, eviction_rate=%.2f/s, "
           "pages_fill_factor=%.3f]",
           name.c_str(), metrics_enabled, total_allocated_pages,
           allocation_rate, eviction_rate, pages_fill_factor);
  return std::string(buf);
}

RegionMetricsImpl::RegionMetricsImpl(
    const RegionOptions& options,
    std::unique_ptr<FillFactorProvider> fill_factor, SystemClock* clock)
    : name_(options.name),
      fill_factor_(std::move(fill_factor)),
      enabled_(options.metrics_enabled),
      total_allocated_pages_(0),
      allocation_rate_(clock, options.rate_time_interval_ms,
                       options.sub_intervals),
      eviction_rate_(clock, options.rate_time_interval_ms,
                     options.sub_intervals) {}

uint64_t RegionMetricsImpl::GetTotalAllocatedPages() const {
  int64_t pages = total_allocated_pages_.load(std::memory_order_relaxed);
  return pages < 0 ? 0 : static_cast<uint64_t>(pages);
}

double RegionMetricsImpl::GetAllocationRate() const {
  if (!IsEnabled()) {
    return 0.0;
  }
  return allocation_rate_.GetRatePerSecond();
}

double RegionMetricsImpl::GetEvictionRate() const {
  if (!IsEnabled()) {
    return 0.0;
  }
  return eviction_rate_.GetRatePerSecond();
}

double RegionMetricsImpl::GetPagesFillFactor() const {
  if (!IsEnabled() || fill_factor_ == nullptr) {
    return 0.0;
  }
  return fill_factor_->GetFillFactor();
}

Status RegionMetricsImpl::SetRateTimeInterval(int64_t rate_time_interval_ms) {
  if (rate_time_interval_ms < 1000) {
    return Status::InvalidArgument(
        "Rate time interval must be at least 1000 milliseconds",
        "name=" + name_ + ", rate_time_interval_ms=" +
            std::to_string(rate_time_interval_ms));
  }
  allocation_rate_.ResetRateTimeInterval(rate_time_interval_ms);
  eviction_rate_.ResetRateTimeInterval(rate_time_interval_ms);
  return Status::OK();
}

Status RegionMetricsImpl::SetSubIntervals(int sub_intervals) {
  if (sub_intervals <= 0) {
    return Status::InvalidArgument(
        "Sub intervals must be greater than zero",
        "name=" + name_ + ", sub_intervals=" + std::to_string(sub_intervals));
  }
  allocation_rate_.ResetSubIntervals(sub_intervals);
  eviction_rate_.ResetSubIntervals(sub_intervals);
  return Status::OK();
}

RegionMetricsSnapshot RegionMetricsImpl::GetSnapshot() const {
  RegionMetricsSnapshot snapshot;
  snapshot.name = name_;
  snapshot.metrics_enabled = IsEnabled();
  snapshot.total_allocated_pages = GetTotalAllocatedPages();
  snapshot.allocation_rate = GetAllocationRate();
  snapshot.eviction_rate = GetEvictionRate();
  snapshot.pages_fill_factor = GetPagesFillFactor();
  return snapshot;
}

void RegionMetricsImpl::UpdateTotalAllocatedPages(int64_t delta) {
  if (!IsEnabled()) {
    return;
  }
  total_allocated_pages_.fetch_add(delta, std::memory_order_relaxed);
  if (delta > 0) {
    allocation_rate_.OnHits(static_cast<uint64_t>(delta));
  }
}

void RegionMetricsImpl::IncrementEvictionRate() {
  if (!IsEnabled()) {
    return;
  }
  eviction_rate_.OnHit();
}

}  // namespace PAGEPOOL_NAMESPACE
