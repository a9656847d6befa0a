//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "evict/page_eviction_tracker_impl.h"

#include <iterator>
#include <string>

#include "monitoring/region_metrics_impl.h"
#include "util/mutexlock.h"

namespace PAGEPOOL_NAMESPACE {

const char* PageEvictionTrackerTypeToString(PageEvictionTrackerType type) {
  switch (type) {
    case PageEvictionTrackerType::kNoOp:
      return "kNoOp";
    case PageEvictionTrackerType::kRandomLRU:
      return "kRandomLRU";
    case PageEvictionTrackerType::kRandom2LRU:
      return "kRandom2LRU";
    case PageEvictionTrackerType::kFairFifo:
      return "kFairFifo";
  }
  return "kUnknown";
}

PageEvictionTrackerType SelectPageEvictionTracker(PageEvictionMode mode,
                                                  bool persistence_enabled,
                                                  bool override_fair_fifo) {
  if (persistence_enabled || mode == PageEvictionMode::kDisabled) {
    return PageEvictionTrackerType::kNoOp;
  }
  if (override_fair_fifo) {
    return PageEvictionTrackerType::kFairFifo;
  }
  switch (mode) {
    case PageEvictionMode::kRandomLRU:
      return PageEvictionTrackerType::kRandomLRU;
    case PageEvictionMode::kRandom2LRU:
      return PageEvictionTrackerType::kRandom2LRU;
    case PageEvictionMode::kDisabled:
      break;
  }
  return PageEvictionTrackerType::kNoOp;
}

std::unique_ptr<PageEvictionTracker> NewPageEvictionTracker(
    PageEvictionTrackerType type, FreeList* free_list,
    RegionMetricsImpl* metrics, SystemClock* clock) {
  switch (type) {
    case PageEvictionTrackerType::kRandomLRU:
      return std::unique_ptr<PageEvictionTracker>(
          new RandomLRUPageEvictionTracker(free_list, metrics, clock));
    case PageEvictionTrackerType::kRandom2LRU:
      return std::unique_ptr<PageEvictionTracker>(
          new Random2LRUPageEvictionTracker(free_list, metrics, clock));
    case PageEvictionTrackerType::kFairFifo:
      return std::unique_ptr<PageEvictionTracker>(
          new FairFifoPageEvictionTracker(free_list, metrics, clock));
    case PageEvictionTrackerType::kNoOp:
      break;
  }
  return std::unique_ptr<PageEvictionTracker>(new NoOpPageEvictionTracker());
}

Status PageEvictionTrackerBase::EvictFromFreeList(PageId page_id) {
  Status s = free_list_->EvictDataPage(page_id);
  if (s.ok() && metrics_ != nullptr) {
    metrics_->IncrementEvictionRate();
  }
  return s;
}

RandomLRUPageEvictionTracker::RandomLRUPageEvictionTracker(
    FreeList* free_list, RegionMetricsImpl* metrics, SystemClock* clock)
    : PageEvictionTrackerBase(free_list, metrics, clock),
      started_(false),
      rnd_(clock->NowNanos()) {}

Status RandomLRUPageEvictionTracker::Start() {
  MutexLock l(&mu_);
  started_ = true;
  return Status::OK();
}

void RandomLRUPageEvictionTracker::Stop() {
  MutexLock l(&mu_);
  started_ = false;
  pages_.clear();
  entries_.clear();
}

size_t RandomLRUPageEvictionTracker::TrackedPages() const {
  MutexLock l(&mu_);
  return pages_.size();
}

void RandomLRUPageEvictionTracker::TouchPage(PageId page_id) {
  const uint64_t now = clock_->NowMicros();
  MutexLock l(&mu_);
  if (!started_) {
    return;
  }
  auto it = entries_.find(page_id);
  if (it == entries_.end()) {
    Entry entry;
    entry.pos = pages_.size();
    pages_.push_back(page_id);
    it = entries_.emplace(page_id, entry).first;
  }
  Touch(&it->second, now);
}

void RandomLRUPageEvictionTracker::ForgetPage(PageId page_id) {
  MutexLock l(&mu_);
  // Reused by a concurrent insert after it was emptied.
  if (free_list_->HoldsRows(page_id)) {
    return;
  }
  ForgetLocked(page_id);
}

void RandomLRUPageEvictionTracker::ForgetLocked(PageId page_id) {
  mu_.AssertHeld();
  auto it = entries_.find(page_id);
  if (it == entries_.end()) {
    return;
  }
  // Move the last page into the freed slot.
  const size_t pos = it->second.pos;
  const PageId last = pages_.back();
  pages_[pos] = last;
  entries_[last].pos = pos;
  pages_.pop_back();
  entries_.erase(page_id);
}

bool RandomLRUPageEvictionTracker::PickVictim(PageId* page_id) {
  mu_.AssertHeld();
  if (pages_.empty()) {
    return false;
  }
  const bool all = pages_.size() <= kSampleSize;
  const size_t samples = all ? pages_.size() : kSampleSize;
  bool found = false;
  uint64_t best_rank = 0;
  for (size_t i = 0; i < samples; ++i) {
    PageId candidate = all ? pages_[i] : pages_[rnd_.Uniform(pages_.size())];
    uint64_t rank = Rank(entries_[candidate]);
    if (!found || rank < best_rank) {
      found = true;
      best_rank = rank;
      *page_id = candidate;
    }
  }
  return found;
}

Status RandomLRUPageEvictionTracker::EvictDataPage() {
  MutexLock l(&mu_);
  int failed_attempts = 0;
  while (true) {
    PageId victim = 0;
    if (!PickVictim(&victim)) {
      return Status::Aborted("Too many failed attempts to evict page",
                             "no tracked data pages");
    }
    Status s = EvictFromFreeList(victim);
    if (s.ok()) {
      ForgetLocked(victim);
      return s;
    }
    if (!s.IsNotFound()) {
      return s;
    }
    // The page lost its rows since it was last touched.
    ForgetLocked(victim);
    if (++failed_attempts >= kMaxFailedAttempts) {
      return Status::Aborted("Too many failed attempts to evict page",
                             "attempts=" + std::to_string(failed_attempts));
    }
  }
}

Status FairFifoPageEvictionTracker::Start() {
  MutexLock l(&mu_);
  started_ = true;
  return Status::OK();
}

void FairFifoPageEvictionTracker::Stop() {
  MutexLock l(&mu_);
  started_ = false;
  queue_.clear();
  index_.clear();
}

void FairFifoPageEvictionTracker::TouchPage(PageId page_id) {
  MutexLock l(&mu_);
  if (!started_ || index_.count(page_id) != 0) {
    return;
  }
  queue_.push_back(page_id);
  index_[page_id] = std::prev(queue_.end());
}

void FairFifoPageEvictionTracker::ForgetPage(PageId page_id) {
  MutexLock l(&mu_);
  if (free_list_->HoldsRows(page_id)) {
    return;
  }
  auto it = index_.find(page_id);
  if (it != index_.end()) {
    queue_.erase(it->second);
    index_.erase(it);
  }
}

Status FairFifoPageEvictionTracker::EvictDataPage() {
  MutexLock l(&mu_);
  while (!queue_.empty()) {
    PageId victim = queue_.front();
    queue_.pop_front();
    index_.erase(victim);
    Status s = EvictFromFreeList(victim);
    if (!s.IsNotFound()) {
      return s;
    }
  }
  return Status::Aborted("Too many failed attempts to evict page",
                         "no tracked data pages");
}

}  // namespace PAGEPOOL_NAMESPACE
