//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "evict/page_eviction_tracker_impl.h"
#include "monitoring/region_metrics_impl.h"
#include "test_util/mock_time_env.h"
#include "test_util/testharness.h"

namespace PAGEPOOL_NAMESPACE {

namespace {

// Knows which pages hold data and records evictions.
class RecordingFreeList : public FreeList {
 public:
  Status AddForRecycle(PageId /*page_id*/) override { return Status::OK(); }
  Status TakeRecycledPage(PageId* /*page_id*/) override {
    return Status::NotFound();
  }
  uint64_t RecycledPagesCount() const override { return evicted.size(); }
  uint64_t EmptyDataPages() const override { return evicted.size(); }
  void GetFillFactor(uint64_t* used, uint64_t* total) const override {
    *used = 0;
    *total = 0;
  }
  Status InsertDataRow(uint32_t /*row_size*/, PageId* /*page_id*/) override {
    return Status::NotSupported();
  }
  Status RemoveDataRow(PageId /*page_id*/, uint32_t /*row_size*/,
                       bool* /*page_emptied*/) override {
    return Status::NotSupported();
  }
  bool HoldsRows(PageId page_id) const override {
    return data_pages.count(page_id) != 0;
  }
  Status EvictDataPage(PageId page_id) override {
    if (data_pages.erase(page_id) == 0) {
      return Status::NotFound("Page holds no rows");
    }
    evicted.push_back(page_id);
    return Status::OK();
  }
  void DumpStatistics(Logger* /*info_log*/) const override {}

  std::set<PageId> data_pages;
  std::vector<PageId> evicted;
};

}  // namespace

class PageEvictionTrackerTest : public testing::Test {
 public:
  PageEvictionTrackerTest()
      : clock_(std::make_shared<MockSystemClock>(SystemClock::Default())) {
    RegionOptions options("r1");
    options.metrics_enabled = true;
    metrics_.reset(new RegionMetricsImpl(options, nullptr, clock_.get()));
  }

  std::unique_ptr<PageEvictionTracker> NewTracker(
      PageEvictionTrackerType type) {
    std::unique_ptr<PageEvictionTracker> tracker =
        NewPageEvictionTracker(type, &free_list_, metrics_.get(), clock_.get());
    EXPECT_OK(tracker->Start());
    return tracker;
  }

  // Adds a data page and touches it one microsecond after the last touch.
  void Touch(PageEvictionTracker* tracker, PageId page_id) {
    free_list_.data_pages.insert(page_id);
    clock_->SleepForMicroseconds(1);
    tracker->TouchPage(page_id);
  }

 protected:
  std::shared_ptr<MockSystemClock> clock_;
  std::unique_ptr<RegionMetricsImpl> metrics_;
  RecordingFreeList free_list_;
};

TEST_F(PageEvictionTrackerTest, SelectTracker) {
  const bool kPersistent = true;
  const bool kFairFifo = true;
  ASSERT_EQ(PageEvictionTrackerType::kNoOp,
            SelectPageEvictionTracker(PageEvictionMode::kDisabled, false,
                                      false));
  ASSERT_EQ(PageEvictionTrackerType::kNoOp,
            SelectPageEvictionTracker(PageEvictionMode::kDisabled, false,
                                      kFairFifo));
  ASSERT_EQ(PageEvictionTrackerType::kNoOp,
            SelectPageEvictionTracker(PageEvictionMode::kRandomLRU,
                                      kPersistent, false));
  ASSERT_EQ(PageEvictionTrackerType::kNoOp,
            SelectPageEvictionTracker(PageEvictionMode::kRandom2LRU,
                                      kPersistent, kFairFifo));
  ASSERT_EQ(PageEvictionTrackerType::kRandomLRU,
            SelectPageEvictionTracker(PageEvictionMode::kRandomLRU, false,
                                      false));
  ASSERT_EQ(PageEvictionTrackerType::kRandom2LRU,
            SelectPageEvictionTracker(PageEvictionMode::kRandom2LRU, false,
                                      false));
  ASSERT_EQ(PageEvictionTrackerType::kFairFifo,
            SelectPageEvictionTracker(PageEvictionMode::kRandom2LRU, false,
                                      kFairFifo));
}

TEST_F(PageEvictionTrackerTest, Names) {
  ASSERT_STREQ("kFairFifo",
               PageEvictionTrackerTypeToString(
                   PageEvictionTrackerType::kFairFifo));
  ASSERT_STREQ("NoOpPageEvictionTracker",
               NewTracker(PageEvictionTrackerType::kNoOp)->Name());
  ASSERT_STREQ("RandomLRUPageEvictionTracker",
               NewTracker(PageEvictionTrackerType::kRandomLRU)->Name());
  ASSERT_STREQ("Random2LRUPageEvictionTracker",
               NewTracker(PageEvictionTrackerType::kRandom2LRU)->Name());
  ASSERT_STREQ("FairFifoPageEvictionTracker",
               NewTracker(PageEvictionTrackerType::kFairFifo)->Name());
}

TEST_F(PageEvictionTrackerTest, NoOpNeverEvicts) {
  auto tracker = NewTracker(PageEvictionTrackerType::kNoOp);
  Touch(tracker.get(), 1);
  ASSERT_OK(tracker->EvictDataPage());
  ASSERT_TRUE(free_list_.evicted.empty());
  tracker->Stop();
}

TEST_F(PageEvictionTrackerTest, RandomLRUEvictsLeastRecentlyTouched) {
  auto tracker = NewTracker(PageEvictionTrackerType::kRandomLRU);
  for (PageId page = 1; page <= 4; ++page) {
    Touch(tracker.get(), page);
  }
  Touch(tracker.get(), 1);

  ASSERT_OK(tracker->EvictDataPage());
  ASSERT_OK(tracker->EvictDataPage());
  ASSERT_EQ(std::vector<PageId>({2, 3}), free_list_.evicted);
  ASSERT_EQ(2u, static_cast<RandomLRUPageEvictionTracker*>(tracker.get())
                    ->TrackedPages());
  ASSERT_GT(metrics_->GetEvictionRate(), 0.0);
}

TEST_F(PageEvictionTrackerTest, RandomLRUSkipsPagesWithoutData) {
  auto tracker = NewTracker(PageEvictionTrackerType::kRandomLRU);
  Touch(tracker.get(), 1);
  Touch(tracker.get(), 2);
  Touch(tracker.get(), 3);
  free_list_.data_pages.erase(1);

  ASSERT_OK(tracker->EvictDataPage());
  ASSERT_EQ(std::vector<PageId>({2}), free_list_.evicted);
  ASSERT_EQ(1u, static_cast<RandomLRUPageEvictionTracker*>(tracker.get())
                    ->TrackedPages());
}

TEST_F(PageEvictionTrackerTest, RandomLRUGivesUp) {
  auto tracker = NewTracker(PageEvictionTrackerType::kRandomLRU);
  ASSERT_TRUE(tracker->EvictDataPage().IsAborted());

  Touch(tracker.get(), 1);
  Touch(tracker.get(), 2);
  free_list_.data_pages.clear();
  Status s = tracker->EvictDataPage();
  ASSERT_TRUE(s.IsAborted());
  ASSERT_NE(std::string::npos, s.ToString().find("Too many failed attempts"));
}

TEST_F(PageEvictionTrackerTest, RandomLRUSamplesManyPages) {
  auto tracker = NewTracker(PageEvictionTrackerType::kRandomLRU);
  const PageId kPages = 200;
  for (PageId page = 0; page < kPages; ++page) {
    Touch(tracker.get(), page);
  }
  for (PageId i = 0; i < kPages; ++i) {
    ASSERT_OK(tracker->EvictDataPage());
  }
  ASSERT_EQ(kPages, free_list_.evicted.size());
  ASSERT_TRUE(free_list_.data_pages.empty());
  ASSERT_TRUE(tracker->EvictDataPage().IsAborted());
}

TEST_F(PageEvictionTrackerTest, ForgetAndStop) {
  auto tracker = NewTracker(PageEvictionTrackerType::kRandomLRU);
  Touch(tracker.get(), 1);
  Touch(tracker.get(), 2);
  free_list_.data_pages.erase(1);
  tracker->ForgetPage(1);
  tracker->ForgetPage(42);
  ASSERT_OK(tracker->EvictDataPage());
  ASSERT_EQ(std::vector<PageId>({2}), free_list_.evicted);

  Touch(tracker.get(), 3);
  tracker->Stop();
  ASSERT_EQ(0u, static_cast<RandomLRUPageEvictionTracker*>(tracker.get())
                    ->TrackedPages());
  // Touches are ignored until restarted.
  Touch(tracker.get(), 4);
  ASSERT_TRUE(tracker->EvictDataPage().IsAborted());
}

TEST_F(PageEvictionTrackerTest, ForgetKeepsPagesHoldingRowsAgain) {
  for (auto type : {PageEvictionTrackerType::kRandomLRU,
                    PageEvictionTrackerType::kRandom2LRU,
                    PageEvictionTrackerType::kFairFifo}) {
    free_list_.data_pages.clear();
    free_list_.evicted.clear();
    auto tracker = NewTracker(type);
    // Page 7 was emptied and then refilled before the emptying caller got
    // to forget it.
    Touch(tracker.get(), 7);
    tracker->ForgetPage(7);
    ASSERT_OK(tracker->EvictDataPage());
    ASSERT_EQ(std::vector<PageId>({7}), free_list_.evicted);
    ASSERT_TRUE(tracker->EvictDataPage().IsAborted());
  }
}

TEST_F(PageEvictionTrackerTest, Random2LRUProtectsPagesTouchedTwice) {
  auto lru = NewTracker(PageEvictionTrackerType::kRandomLRU);
  auto lru2 = NewTracker(PageEvictionTrackerType::kRandom2LRU);
  for (auto* tracker : {lru.get(), lru2.get()}) {
    Touch(tracker, 1);
    Touch(tracker, 1);
    Touch(tracker, 2);
  }

  ASSERT_OK(lru->EvictDataPage());
  ASSERT_EQ(std::vector<PageId>({1}), free_list_.evicted);

  free_list_.data_pages.insert(1);
  free_list_.evicted.clear();
  ASSERT_OK(lru2->EvictDataPage());
  ASSERT_EQ(std::vector<PageId>({2}), free_list_.evicted);
}

TEST_F(PageEvictionTrackerTest, FairFifoEvictsInFirstTouchOrder) {
  auto tracker = NewTracker(PageEvictionTrackerType::kFairFifo);
  Touch(tracker.get(), 1);
  Touch(tracker.get(), 2);
  Touch(tracker.get(), 3);
  Touch(tracker.get(), 1);
  free_list_.data_pages.erase(2);
  tracker->ForgetPage(2);

  ASSERT_OK(tracker->EvictDataPage());
  ASSERT_OK(tracker->EvictDataPage());
  ASSERT_EQ(std::vector<PageId>({1, 3}), free_list_.evicted);
  ASSERT_TRUE(tracker->EvictDataPage().IsAborted());
}

}  // namespace PAGEPOOL_NAMESPACE

int main(int argc, char** argv) {
  PAGEPOOL_NAMESPACE::port::InstallStackTraceHandler();
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
