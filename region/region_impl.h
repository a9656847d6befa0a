//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <memory>
#include <string>

#include "memory/direct_memory_provider.h"
#include "memory/page_memory_no_store.h"
#include "monitoring/fill_factor_provider.h"
#include "monitoring/region_metrics_impl.h"
#include "pagepool/region.h"
#include "region/free_list_impl.h"

namespace PAGEPOOL_NAMESPACE {

// A region wired from its parts: metrics, page memory, free list and
// eviction tracker, constructed in that order and destroyed in reverse.
class RegionImpl : public Region {
 public:
  // `resolver` binds the fill factor of the metrics to the free list once
  // the owning registry publishes it; it may be nullptr.
  RegionImpl(const RegionOptions& options, uint32_t page_size,
             bool is_default, bool persistence_enabled,
             PageEvictionTrackerType tracker_type,
             std::unique_ptr<DirectMemoryProvider> provider,
             FreeListResolver* resolver, SystemClock* clock,
             std::shared_ptr<Logger> info_log);

  // No copying allowed
  RegionImpl(const RegionImpl&) = delete;
  void operator=(const RegionImpl&) = delete;

  ~RegionImpl() override;

  // Maps the initial memory and starts the eviction tracker.
  Status Start();

  // Stops the tracker and releases all memory. Errors are logged and
  // returned.
  Status Stop();

  // Evicts pages until the region is back under its eviction watermark or
  // enough empty pages are pooled.
  Status EnsureFreeSpace();

  const std::string& Name() const override { return options_.name; }
  const RegionOptions& GetOptions() const override { return options_; }
  bool IsDefault() const override { return is_default_; }
  PageMemory* GetPageMemory() const override { return page_memory_.get(); }
  FreeList* GetFreeList() const override { return free_list_.get(); }
  PageEvictionTracker* GetEvictionTracker() const override {
    return tracker_.get();
  }
  RegionMetrics* GetMetrics() const override { return metrics_.get(); }
  RegionMetricsSnapshot GetMetricsSnapshot() const override {
    return metrics_->GetSnapshot();
  }

  Status InsertDataRow(uint32_t row_size, PageId* page_id) override;
  Status RemoveDataRow(PageId page_id, uint32_t row_size) override;
  void TouchPage(PageId page_id) override;

  PageEvictionTrackerType GetEvictionTrackerType() const {
    return tracker_type_;
  }

 private:
  const RegionOptions options_;
  const bool is_default_;
  const bool persistence_enabled_;
  const PageEvictionTrackerType tracker_type_;
  std::shared_ptr<Logger> info_log_;
  std::unique_ptr<RegionMetricsImpl> metrics_;
  std::unique_ptr<PageMemoryNoStore> page_memory_;
  std::unique_ptr<FreeListImpl> free_list_;
  std::unique_ptr<PageEvictionTracker> tracker_;
  bool started_;
};

}  // namespace PAGEPOOL_NAMESPACE
