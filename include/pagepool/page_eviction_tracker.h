//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include "pagepool/options.h"
#include "pagepool/page_memory.h"
#include "pagepool/pagepool_namespace.h"
#include "pagepool/status.h"

namespace PAGEPOOL_NAMESPACE {

enum class PageEvictionTrackerType : unsigned char {
  kNoOp,
  kRandomLRU,
  kRandom2LRU,
  kFairFifo,
};

extern const char* PageEvictionTrackerTypeToString(
    PageEvictionTrackerType type);

// Picks the tracker of a region. Persistence-backed regions and regions with
// eviction disabled never evict; otherwise `override_fair_fifo` wins over
// the configured mode.
extern PageEvictionTrackerType SelectPageEvictionTracker(
    PageEvictionMode mode, bool persistence_enabled, bool override_fair_fifo);

// Chooses which data page of a region is dropped when the region runs out
// of room. Pages are reported through TouchPage() whenever they are
// accessed.
//
// Implementations are thread-safe.
class PageEvictionTracker {
 public:
  virtual ~PageEvictionTracker() {}

  virtual const char* Name() const = 0;

  virtual Status Start() = 0;

  virtual void Stop() = 0;

  virtual void TouchPage(PageId page_id) = 0;

  // The page was emptied and must not be picked. Ignored when the page
  // already holds rows again.
  virtual void ForgetPage(PageId page_id) = 0;

  // Evicts one data page. Returns Aborted if no page could be evicted.
  virtual Status EvictDataPage() = 0;
};

}  // namespace PAGEPOOL_NAMESPACE
