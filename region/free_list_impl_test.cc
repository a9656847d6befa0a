//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "region/free_list_impl.h"

#include <memory>
#include <set>
#include <string>

#include "test_util/testharness.h"

namespace PAGEPOOL_NAMESPACE {

namespace {

// Hands out page ids up to a fixed number of pages. Every allocated page
// shares one scratch buffer.
class CountingPageMemory : public PageMemory {
 public:
  explicit CountingPageMemory(uint64_t max_pages)
      : max_pages_(max_pages), scratch_(new char[4096]) {}

  Status Start() override { return Status::OK(); }
  Status Stop() override { return Status::OK(); }
  uint64_t LoadedPages() const override { return loaded_; }
  uint32_t SystemPageSize() const override { return 4096 + 24; }
  uint32_t PageSize() const override { return 4096; }

  Status AllocatePage(PageId* page_id) override {
    if (loaded_ >= max_pages_) {
      return Status::Aborted("Out of memory in region", "test");
    }
    *page_id = MakePageId(0, static_cast<uint32_t>(loaded_++));
    allocated_.insert(*page_id);
    return Status::OK();
  }

  Status FreePage(PageId page_id) override {
    allocated_.erase(page_id);
    loaded_--;
    return Status::OK();
  }

  char* PageAddress(PageId page_id) const override {
    return allocated_.count(page_id) != 0 ? scratch_.get() : nullptr;
  }

 private:
  const uint64_t max_pages_;
  uint64_t loaded_ = 0;
  std::set<PageId> allocated_;
  std::unique_ptr<char[]> scratch_;
};

}  // namespace

class FreeListImplTest : public testing::Test {
 public:
  FreeListImplTest() : page_memory_(16), free_list_("r1", &page_memory_) {}

 protected:
  CountingPageMemory page_memory_;
  FreeListImpl free_list_;
};

TEST_F(FreeListImplTest, RejectsBadRowSizes) {
  PageId page = 0;
  ASSERT_TRUE(free_list_.InsertDataRow(0, &page).IsInvalidArgument());
  ASSERT_EQ(4096u, free_list_.PageCapacity());
  ASSERT_TRUE(free_list_.InsertDataRow(4097, &page).IsNotSupported());
  ASSERT_OK(free_list_.InsertDataRow(4096, &page));
  ASSERT_EQ(1u, page_memory_.LoadedPages());
}

TEST_F(FreeListImplTest, RowsShareAPage) {
  PageId p1 = 0;
  PageId p2 = 0;
  ASSERT_OK(free_list_.InsertDataRow(100, &p1));
  ASSERT_OK(free_list_.InsertDataRow(200, &p2));
  ASSERT_EQ(p1, p2);
  ASSERT_EQ(1u, page_memory_.LoadedPages());
  ASSERT_EQ(1u, free_list_.DataPagesCount());

  uint64_t used = 0;
  uint64_t total = 0;
  free_list_.GetFillFactor(&used, &total);
  ASSERT_EQ(300u, used);
  ASSERT_EQ(4096u, total);
}

TEST_F(FreeListImplTest, FullPageSpillsToNewPage) {
  PageId p1 = 0;
  PageId p2 = 0;
  ASSERT_OK(free_list_.InsertDataRow(4000, &p1));
  ASSERT_OK(free_list_.InsertDataRow(200, &p2));
  ASSERT_NE(p1, p2);
  ASSERT_EQ(2u, page_memory_.LoadedPages());

  // 96 bytes still fit on the first page.
  PageId p3 = 0;
  ASSERT_OK(free_list_.InsertDataRow(96, &p3));
  ASSERT_EQ(p1, p3);
}

TEST_F(FreeListImplTest, PrefersTightestPage) {
  PageId a = 0;
  PageId b = 0;
  ASSERT_OK(free_list_.InsertDataRow(3096, &a));  // 1000 bytes left
  ASSERT_OK(free_list_.InsertDataRow(1096, &b));  // does not fit on a
  ASSERT_NE(a, b);

  PageId c = 0;
  ASSERT_OK(free_list_.InsertDataRow(900, &c));
  ASSERT_EQ(a, c);
  PageId d = 0;
  ASSERT_OK(free_list_.InsertDataRow(900, &d));
  ASSERT_EQ(b, d);
}

TEST_F(FreeListImplTest, RemovingLastRowEmptiesPage) {
  PageId page = 0;
  ASSERT_OK(free_list_.InsertDataRow(100, &page));
  ASSERT_OK(free_list_.InsertDataRow(100, &page));

  bool emptied = true;
  ASSERT_OK(free_list_.RemoveDataRow(page, 100, &emptied));
  ASSERT_FALSE(emptied);
  ASSERT_EQ(0u, free_list_.EmptyDataPages());
  ASSERT_OK(free_list_.RemoveDataRow(page, 100, &emptied));
  ASSERT_TRUE(emptied);
  ASSERT_EQ(1u, free_list_.EmptyDataPages());

  uint64_t used = 1;
  uint64_t total = 1;
  free_list_.GetFillFactor(&used, &total);
  ASSERT_EQ(0u, used);
  ASSERT_EQ(0u, total);

  // The empty page is reused before memory is allocated.
  PageId again = 0;
  ASSERT_OK(free_list_.InsertDataRow(10, &again));
  ASSERT_EQ(page, again);
  ASSERT_EQ(1u, page_memory_.LoadedPages());
  ASSERT_EQ(0u, free_list_.EmptyDataPages());
}

TEST_F(FreeListImplTest, RemoveErrors) {
  ASSERT_TRUE(free_list_.RemoveDataRow(MakePageId(3, 3), 10, nullptr)
                  .IsNotFound());
  PageId page = 0;
  ASSERT_OK(free_list_.InsertDataRow(100, &page));
  ASSERT_TRUE(free_list_.RemoveDataRow(page, 101, nullptr).IsInvalidArgument());
  ASSERT_OK(free_list_.RemoveDataRow(page, 100, nullptr));
  ASSERT_TRUE(free_list_.RemoveDataRow(page, 100, nullptr).IsNotFound());
}

TEST_F(FreeListImplTest, EvictDataPage) {
  PageId p1 = 0;
  PageId p2 = 0;
  PageId p3 = 0;
  ASSERT_OK(free_list_.InsertDataRow(3000, &p1));
  ASSERT_OK(free_list_.InsertDataRow(500, &p3));
  ASSERT_EQ(p1, p3);
  ASSERT_OK(free_list_.InsertDataRow(3000, &p2));
  ASSERT_NE(p1, p2);

  ASSERT_OK(free_list_.EvictDataPage(p1));
  ASSERT_EQ(1u, free_list_.EmptyDataPages());
  ASSERT_TRUE(free_list_.EvictDataPage(p1).IsNotFound());

  uint64_t used = 0;
  uint64_t total = 0;
  free_list_.GetFillFactor(&used, &total);
  ASSERT_EQ(3000u, used);
  ASSERT_EQ(4096u, total);
  // Evicted pages stay allocated.
  ASSERT_EQ(2u, page_memory_.LoadedPages());
}

TEST_F(FreeListImplTest, ReuseList) {
  PageId page = 0;
  ASSERT_TRUE(free_list_.TakeRecycledPage(&page).IsNotFound());
  ASSERT_EQ(0u, free_list_.RecycledPagesCount());

  PageId spare = 0;
  ASSERT_OK(page_memory_.AllocatePage(&spare));
  ASSERT_OK(free_list_.AddForRecycle(spare));
  ASSERT_EQ(1u, free_list_.RecycledPagesCount());
  ASSERT_OK(free_list_.TakeRecycledPage(&page));
  ASSERT_EQ(spare, page);
  ASSERT_EQ(0u, free_list_.RecycledPagesCount());

  PageId used_page = 0;
  ASSERT_OK(free_list_.InsertDataRow(10, &used_page));
  ASSERT_TRUE(free_list_.AddForRecycle(used_page).IsInvalidArgument());
}

TEST_F(FreeListImplTest, RecycleRejectsDuplicateAndUnallocatedPages) {
  PageId page = 0;
  ASSERT_OK(page_memory_.AllocatePage(&page));
  ASSERT_OK(free_list_.AddForRecycle(page));
  Status s = free_list_.AddForRecycle(page);
  ASSERT_TRUE(s.IsInvalidArgument());
  ASSERT_NE(std::string::npos, s.ToString().find("already recycled"));
  ASSERT_EQ(1u, free_list_.EmptyDataPages());
  ASSERT_LE(free_list_.EmptyDataPages(), page_memory_.LoadedPages());

  // Never handed out by page memory.
  s = free_list_.AddForRecycle(MakePageId(0, 7));
  ASSERT_TRUE(s.IsInvalidArgument());
  ASSERT_NE(std::string::npos, s.ToString().find("not allocated"));

  // Inserting reuses the pooled page; emptying it pools it once again.
  PageId data_page = 0;
  ASSERT_OK(free_list_.InsertDataRow(4096, &data_page));
  ASSERT_EQ(page, data_page);
  ASSERT_TRUE(free_list_.HoldsRows(data_page));
  ASSERT_EQ(0u, free_list_.EmptyDataPages());
  ASSERT_TRUE(free_list_.AddForRecycle(data_page).IsInvalidArgument());
  bool emptied = false;
  ASSERT_OK(free_list_.RemoveDataRow(data_page, 4096, &emptied));
  ASSERT_TRUE(emptied);
  ASSERT_FALSE(free_list_.HoldsRows(data_page));
  ASSERT_TRUE(free_list_.AddForRecycle(data_page).IsInvalidArgument());
  ASSERT_EQ(1u, free_list_.EmptyDataPages());

  // Taking a page out of the pool allows it back in.
  ASSERT_OK(free_list_.TakeRecycledPage(&page));
  ASSERT_EQ(data_page, page);
  ASSERT_EQ(0u, free_list_.EmptyDataPages());
  ASSERT_OK(free_list_.AddForRecycle(page));
  ASSERT_EQ(1u, free_list_.EmptyDataPages());
  ASSERT_LE(free_list_.EmptyDataPages(), page_memory_.LoadedPages());
}

TEST_F(FreeListImplTest, AllocationFailurePropagates) {
  PageId page = 0;
  for (int i = 0; i < 16; ++i) {
    ASSERT_OK(free_list_.InsertDataRow(4096, &page));
  }
  ASSERT_TRUE(free_list_.InsertDataRow(1, &page).IsAborted());
  ASSERT_EQ(16u, free_list_.DataPagesCount());
}

}  // namespace PAGEPOOL_NAMESPACE

int main(int argc, char** argv) {
  PAGEPOOL_NAMESPACE::port::InstallStackTraceHandler();
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
