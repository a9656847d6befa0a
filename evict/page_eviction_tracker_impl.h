//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stdint.h>

#include <list>
#include <memory>
#include <unordered_map>
#include <vector>

#include "pagepool/free_list.h"
#include "pagepool/page_eviction_tracker.h"
#include "pagepool/system_clock.h"
#include "port/port.h"
#include "util/random.h"

namespace PAGEPOOL_NAMESPACE {

class RegionMetricsImpl;

// Creates the tracker of `type` for a region. `metrics` may be nullptr.
// Neither `free_list`, `metrics` nor `clock` is owned; they must outlive the
// tracker.
extern std::unique_ptr<PageEvictionTracker> NewPageEvictionTracker(
    PageEvictionTrackerType type, FreeList* free_list,
    RegionMetricsImpl* metrics, SystemClock* clock);

// Used for regions that never evict.
class NoOpPageEvictionTracker : public PageEvictionTracker {
 public:
  const char* Name() const override { return "NoOpPageEvictionTracker"; }
  Status Start() override { return Status::OK(); }
  void Stop() override {}
  void TouchPage(PageId /*page_id*/) override {}
  void ForgetPage(PageId /*page_id*/) override {}
  Status EvictDataPage() override { return Status::OK(); }
};

// Shared part of the trackers that evict through a FreeList.
//
// Lock order: a tracker's mutex is always acquired before the free list's.
class PageEvictionTrackerBase : public PageEvictionTracker {
 public:
  PageEvictionTrackerBase(FreeList* free_list, RegionMetricsImpl* metrics,
                          SystemClock* clock)
      : free_list_(free_list), metrics_(metrics), clock_(clock) {}

 protected:
  // Asks the free list to drop the page. Returns NotFound if the page no
  // longer holds data.
  Status EvictFromFreeList(PageId page_id);

  FreeList* const free_list_;
  RegionMetricsImpl* const metrics_;
  SystemClock* const clock_;
};

// Samples kSampleSize tracked pages at random and evicts the least recently
// touched one. When no more than kSampleSize pages are tracked every page is
// considered.
class RandomLRUPageEvictionTracker : public PageEvictionTrackerBase {
 public:
  static constexpr size_t kSampleSize = 5;
  static constexpr int kMaxFailedAttempts = 5000;

  RandomLRUPageEvictionTracker(FreeList* free_list,
                               RegionMetricsImpl* metrics, SystemClock* clock);

  const char* Name() const override { return "RandomLRUPageEvictionTracker"; }

  Status Start() override;
  void Stop() override;
  void TouchPage(PageId page_id) override;
  void ForgetPage(PageId page_id) override;
  Status EvictDataPage() override;

  size_t TrackedPages() const;

 protected:
  struct Entry {
    size_t pos = 0;
    uint64_t latest = 0;
    uint64_t previous = 0;
  };

  // Records an access at `now_micros`.
  virtual void Touch(Entry* entry, uint64_t now_micros) const {
    entry->latest = now_micros;
  }

  // Pages with the smallest rank are evicted first.
  virtual uint64_t Rank(const Entry& entry) const { return entry.latest; }

 private:
  // REQUIRES: mu_ held
  bool PickVictim(PageId* page_id);
  // REQUIRES: mu_ held
  void ForgetLocked(PageId page_id);

  mutable port::Mutex mu_;
  bool started_;
  std::vector<PageId> pages_;
  std::unordered_map<PageId, Entry> entries_;
  Random64 rnd_;
};

// Random-LRU ranking pages by the older of their two latest accesses, so a
// page touched once goes before any page touched twice.
class Random2LRUPageEvictionTracker : public RandomLRUPageEvictionTracker {
 public:
  Random2LRUPageEvictionTracker(FreeList* free_list,
                                RegionMetricsImpl* metrics, SystemClock* clock)
      : RandomLRUPageEvictionTracker(free_list, metrics, clock) {}

  const char* Name() const override { return "Random2LRUPageEvictionTracker"; }

 protected:
  void Touch(Entry* entry, uint64_t now_micros) const override {
    entry->previous = entry->latest;
    entry->latest = now_micros;
  }

  uint64_t Rank(const Entry& entry) const override {
    return entry.previous < entry.latest ? entry.previous : entry.latest;
  }
};

// Evicts pages in the order they were first touched.
class FairFifoPageEvictionTracker : public PageEvictionTrackerBase {
 public:
  FairFifoPageEvictionTracker(FreeList* free_list, RegionMetricsImpl* metrics,
                              SystemClock* clock)
      : PageEvictionTrackerBase(free_list, metrics, clock), started_(false) {}

  const char* Name() const override { return "FairFifoPageEvictionTracker"; }

  Status Start() override;
  void Stop() override;
  void TouchPage(PageId page_id) override;
  void ForgetPage(PageId page_id) override;
  Status EvictDataPage() override;

 private:
  port::Mutex mu_;
  bool started_;
  std::list<PageId> queue_;
  std::unordered_map<PageId, std::list<PageId>::iterator> index_;
};

}  // namespace PAGEPOOL_NAMESPACE
