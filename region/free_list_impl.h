//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stdint.h>

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "pagepool/free_list.h"
#include "pagepool/page_memory.h"
#include "port/port.h"

namespace PAGEPOOL_NAMESPACE {

// Space accounting of the data pages of one region. Rows are not stored;
// only the number of rows and bytes used per page are tracked.
//
// Pages with rows are kept in kBucketCount buckets by free space so that an
// insert finds a page with enough room without scanning every page. Pages
// without rows form the empty pool, which doubles as the reuse list.
class FreeListImpl : public FreeList {
 public:
  static constexpr size_t kBucketCount = 8;

  FreeListImpl(std::string region_name, PageMemory* page_memory);

  // No copying allowed
  FreeListImpl(const FreeListImpl&) = delete;
  void operator=(const FreeListImpl&) = delete;

  ~FreeListImpl() override {}

  Status AddForRecycle(PageId page_id) override;
  Status TakeRecycledPage(PageId* page_id) override;
  uint64_t RecycledPagesCount() const override;

  uint64_t EmptyDataPages() const override;
  void GetFillFactor(uint64_t* used, uint64_t* total) const override;
  Status InsertDataRow(uint32_t row_size, PageId* page_id) override;
  Status RemoveDataRow(PageId page_id, uint32_t row_size,
                       bool* page_emptied) override;
  bool HoldsRows(PageId page_id) const override;
  Status EvictDataPage(PageId page_id) override;
  void DumpStatistics(Logger* info_log) const override;

  // Bytes of rows a single page can hold.
  uint32_t PageCapacity() const { return capacity_; }

  // Number of pages holding at least one row.
  uint64_t DataPagesCount() const;

 private:
  struct PageInfo {
    uint32_t used_bytes = 0;
    uint32_t rows = 0;
  };

  // Bucket of a page with `free_bytes` of room, or -1 if the page is full.
  int BucketFor(uint32_t free_bytes) const;

  // REQUIRES: mu_ held
  void Unbucket(PageId page_id, const PageInfo& info);
  // REQUIRES: mu_ held
  void Bucket(PageId page_id, const PageInfo& info);
  // REQUIRES: mu_ held
  bool FindPageWithRoom(uint32_t row_size, PageId* page_id) const;
  // REQUIRES: mu_ held
  void PushEmptyPage(PageId page_id);
  // REQUIRES: mu_ held, empty pool not empty
  PageId PopEmptyPage();

  const std::string region_name_;
  PageMemory* const page_memory_;
  const uint32_t capacity_;

  mutable port::Mutex mu_;
  std::unordered_map<PageId, PageInfo> pages_;
  std::vector<std::unordered_set<PageId>> buckets_;
  // LIFO pool of empty pages; empty_page_set_ holds the same ids.
  std::vector<PageId> empty_pages_;
  std::unordered_set<PageId> empty_page_set_;
  uint64_t used_bytes_;
};

}  // namespace PAGEPOOL_NAMESPACE
