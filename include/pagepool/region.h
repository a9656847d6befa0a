//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stdint.h>

#include <string>

#include "pagepool/free_list.h"
#include "pagepool/options.h"
#include "pagepool/page_eviction_tracker.h"
#include "pagepool/page_memory.h"
#include "pagepool/region_metrics.h"
#include "pagepool/status.h"

namespace PAGEPOOL_NAMESPACE {

// A memory region: a budget of pages together with the structures that
// manage it. A Region is owned by its RegionRegistry and lives until the
// registry is deactivated.
class Region {
 public:
  virtual ~Region() {}

  virtual const std::string& Name() const = 0;

  // The validated options of the region.
  virtual const RegionOptions& GetOptions() const = 0;

  // True for the region returned by lookups without a name.
  virtual bool IsDefault() const = 0;

  virtual PageMemory* GetPageMemory() const = 0;

  virtual FreeList* GetFreeList() const = 0;

  virtual PageEvictionTracker* GetEvictionTracker() const = 0;

  virtual RegionMetrics* GetMetrics() const = 0;

  virtual RegionMetricsSnapshot GetMetricsSnapshot() const = 0;

  // Evicts pages as needed to stay under the eviction threshold, then
  // places a row of `row_size` bytes and returns its page.
  virtual Status InsertDataRow(uint32_t row_size, PageId* page_id) = 0;

  virtual Status RemoveDataRow(PageId page_id, uint32_t row_size) = 0;

  // Records an access to a page for the eviction tracker.
  virtual void TouchPage(PageId page_id) = 0;
};

}  // namespace PAGEPOOL_NAMESPACE
