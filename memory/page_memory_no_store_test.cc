//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "memory/page_memory_no_store.h"

#include <stdio.h>
#include <string.h>

#include <set>
#include <string>
#include <vector>

#include "monitoring/region_metrics_impl.h"
#include "test_util/testharness.h"

namespace PAGEPOOL_NAMESPACE {

namespace {
const uint64_t kMB = 1024ull * 1024;
const uint32_t kPageSize = 4096;
const uint32_t kSysPageSize = kPageSize + PageMemoryNoStore::kPageHeaderSize;
}  // namespace

class PageMemoryNoStoreTest : public testing::Test {
 public:
  PageMemoryNoStoreTest() : options_("r1") {
    options_.initial_size = 1 * kMB;
    options_.max_size = 2 * kMB;
    options_.metrics_enabled = true;
    metrics_.reset(new RegionMetricsImpl(options_, nullptr,
                                         SystemClock::Default().get()));
  }

  std::unique_ptr<PageMemoryNoStore> NewPageMemory(
      std::unique_ptr<DirectMemoryProvider> provider) {
    return std::unique_ptr<PageMemoryNoStore>(new PageMemoryNoStore(
        options_, kPageSize, std::move(provider), metrics_.get(), nullptr));
  }

  std::unique_ptr<PageMemoryNoStore> NewAnonymousPageMemory() {
    return NewPageMemory(std::unique_ptr<DirectMemoryProvider>(
        new AnonymousMemoryProvider()));
  }

 protected:
  RegionOptions options_;
  std::unique_ptr<RegionMetricsImpl> metrics_;
};

TEST_F(PageMemoryNoStoreTest, SegmentSizes) {
  const uint64_t kSeg = PageMemoryNoStore::kMinSegmentSize;
  ASSERT_EQ(std::vector<uint64_t>({256 * kMB}),
            PageMemoryNoStore::ComputeSegmentSizes(256 * kMB, 256 * kMB));
  ASSERT_EQ(std::vector<uint64_t>({256 * kMB, 100 * kMB}),
            PageMemoryNoStore::ComputeSegmentSizes(256 * kMB, 356 * kMB));
  ASSERT_EQ(std::vector<uint64_t>({10 * kMB, kSeg, kSeg, 10 * kMB}),
            PageMemoryNoStore::ComputeSegmentSizes(10 * kMB,
                                                   20 * kMB + 2 * kSeg));

  std::vector<uint64_t> sizes =
      PageMemoryNoStore::ComputeSegmentSizes(kSeg, kSeg + 30 * kSeg);
  ASSERT_EQ(PageMemoryNoStore::kSegmentCount, sizes.size());
  ASSERT_EQ(kSeg, sizes[0]);
  ASSERT_EQ(2 * kSeg, sizes[1]);
}

TEST_F(PageMemoryNoStoreTest, RequiresStart) {
  auto page_memory = NewAnonymousPageMemory();
  PageId page = 0;
  ASSERT_TRUE(page_memory->AllocatePage(&page).IsShutdownInProgress());
  ASSERT_OK(page_memory->Start());
  ASSERT_OK(page_memory->Start());
  ASSERT_OK(page_memory->AllocatePage(&page));
  ASSERT_OK(page_memory->Stop());
  ASSERT_OK(page_memory->Stop());
  ASSERT_EQ(0u, page_memory->LoadedPages());
  ASSERT_TRUE(page_memory->AllocatePage(&page).IsShutdownInProgress());
}

TEST_F(PageMemoryNoStoreTest, AllocateAndFree) {
  auto page_memory = NewAnonymousPageMemory();
  ASSERT_EQ(kPageSize, page_memory->PageSize());
  ASSERT_EQ(kSysPageSize, page_memory->SystemPageSize());
  ASSERT_OK(page_memory->Start());

  std::set<PageId> pages;
  for (int i = 0; i < 10; ++i) {
    PageId page = 0;
    ASSERT_OK(page_memory->AllocatePage(&page));
    char* addr = page_memory->PageAddress(page);
    ASSERT_NE(nullptr, addr);
    memset(addr, 0xab, kPageSize);
    pages.insert(page);
  }
  ASSERT_EQ(10u, pages.size());
  ASSERT_EQ(10u, page_memory->LoadedPages());
  ASSERT_EQ(10u, metrics_->GetTotalAllocatedPages());

  PageId freed = *pages.begin();
  ASSERT_OK(page_memory->FreePage(freed));
  ASSERT_EQ(nullptr, page_memory->PageAddress(freed));
  ASSERT_TRUE(page_memory->FreePage(freed).IsInvalidArgument());
  ASSERT_TRUE(
      page_memory->FreePage(MakePageId(7, 0)).IsInvalidArgument());
  ASSERT_EQ(9u, page_memory->LoadedPages());
  ASSERT_EQ(9u, metrics_->GetTotalAllocatedPages());

  // Freed pages come back first.
  PageId page = 0;
  ASSERT_OK(page_memory->AllocatePage(&page));
  ASSERT_EQ(freed, page);
  ASSERT_OK(page_memory->Stop());
}

TEST_F(PageMemoryNoStoreTest, RunsOutOfMemory) {
  auto page_memory = NewAnonymousPageMemory();
  ASSERT_OK(page_memory->Start());

  // Two segments of 1 MB each.
  const uint64_t kPages = 2 * ((1 * kMB) / kSysPageSize);
  PageId page = 0;
  for (uint64_t i = 0; i < kPages; ++i) {
    ASSERT_OK(page_memory->AllocatePage(&page));
  }
  ASSERT_EQ(1u, PageSegment(page));
  ASSERT_EQ(kPages, page_memory->LoadedPages());

  Status s = page_memory->AllocatePage(&page);
  ASSERT_TRUE(s.IsAborted());
  ASSERT_NE(std::string::npos, s.ToString().find("Out of memory in region"));
  ASSERT_NE(std::string::npos, s.ToString().find("r1"));

  // A freed page can be handed out again.
  ASSERT_OK(page_memory->FreePage(MakePageId(0, 3)));
  ASSERT_OK(page_memory->AllocatePage(&page));
  ASSERT_EQ(MakePageId(0, 3), page);
}

TEST_F(PageMemoryNoStoreTest, MappedFiles) {
  Env* env = Env::Default();
  const std::string dir = test::PerThreadPath("page_memory_no_store_test");
  ASSERT_OK(env->CreateDirRecursively(dir));

  // Left over from an earlier run.
  const std::string stale = MappedFileMemoryProvider::AllocatorFileName(dir, 9);
  FILE* f = fopen(stale.c_str(), "w");
  ASSERT_NE(nullptr, f);
  fclose(f);
  ASSERT_OK(env->FileExists(stale));

  auto page_memory = NewPageMemory(std::unique_ptr<DirectMemoryProvider>(
      new MappedFileMemoryProvider(env, dir, nullptr)));
  ASSERT_OK(page_memory->Start());
  ASSERT_TRUE(env->FileExists(stale).IsNotFound());
  const std::string file = MappedFileMemoryProvider::AllocatorFileName(dir, 0);
  ASSERT_OK(env->FileExists(file));

  PageId page = 0;
  ASSERT_OK(page_memory->AllocatePage(&page));
  memset(page_memory->PageAddress(page), 1, kPageSize);

  ASSERT_OK(page_memory->Stop());
  ASSERT_TRUE(env->FileExists(MappedFileMemoryProvider::AllocatorFileName(
                                  dir, 0))
                  .IsNotFound());
  ASSERT_OK(env->DeleteDir(dir));
}

TEST_F(PageMemoryNoStoreTest, MappedFileRemovedBehindProvider) {
  Env* env = Env::Default();
  const std::string dir = test::PerThreadPath("mapped_file_removed");
  MappedFileMemoryProvider provider(env, dir, nullptr);
  ASSERT_OK(provider.Initialize({64 * 1024}));
  DirectMemoryRegion region;
  ASSERT_OK(provider.NextRegion(&region));
  ASSERT_TRUE(region.address != nullptr);

  const std::string file = MappedFileMemoryProvider::AllocatorFileName(dir, 0);
  ASSERT_OK(env->DeleteFile(file));
  Status s = provider.Shutdown();
  ASSERT_TRUE(s.IsIOError()) << s.ToString();
  ASSERT_NE(std::string::npos, s.ToString().find(file));
  ASSERT_OK(env->DeleteDir(dir));
}

}  // namespace PAGEPOOL_NAMESPACE

int main(int argc, char** argv) {
  PAGEPOOL_NAMESPACE::port::InstallStackTraceHandler();
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
