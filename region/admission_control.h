//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include "pagepool/free_list.h"
#include "pagepool/options.h"
#include "pagepool/page_eviction_tracker.h"
#include "pagepool/page_memory.h"
#include "pagepool/status.h"

namespace PAGEPOOL_NAMESPACE {

class Logger;

// Number of loaded pages above which a region starts evicting.
extern double EvictionWatermarkPages(const RegionOptions& options,
                                     uint32_t system_page_size);

// Runs before a page of a region is allocated. While more pages than the
// eviction watermark are loaded and fewer than empty_pages_pool_size pages
// are empty, one data page is evicted. Does nothing when eviction is
// disabled or the region is persistence-backed.
//
// Safe to call from many threads at once; the tracker serializes the
// evictions, and the page counts read here may lag behind concurrent
// allocations.
//
// Returns the first error of the tracker, which is also logged.
extern Status EnsureFreeSpace(const RegionOptions& options,
                              bool persistence_enabled,
                              PageMemory* page_memory, FreeList* free_list,
                              PageEvictionTracker* tracker, Logger* info_log);

}  // namespace PAGEPOOL_NAMESPACE
