//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stdint.h>

#include "pagepool/page_memory.h"
#include "pagepool/pagepool_namespace.h"
#include "pagepool/status.h"

namespace PAGEPOOL_NAMESPACE {

class Logger;

// Pages of a region that hold no rows and can be handed out again.
class ReuseList {
 public:
  virtual ~ReuseList() {}

  // Returns an allocated, unused page to the pool. InvalidArgument if the
  // page holds rows, is already pooled or was never allocated.
  virtual Status AddForRecycle(PageId page_id) = 0;

  // Takes a page out of the pool. Returns NotFound if the pool is empty.
  virtual Status TakeRecycledPage(PageId* page_id) = 0;

  virtual uint64_t RecycledPagesCount() const = 0;
};

// Tracks how full the data pages of a region are and picks the page a new
// row goes to. Empty data pages form the reuse pool.
//
// All methods are thread-safe.
class FreeList : public ReuseList {
 public:
  ~FreeList() override {}

  // Number of data pages holding no rows.
  virtual uint64_t EmptyDataPages() const = 0;

  // Bytes used by rows, and the capacity of the pages holding them. Empty
  // pages count toward neither.
  virtual void GetFillFactor(uint64_t* used, uint64_t* total) const = 0;

  // Reserves `row_size` bytes on some data page and returns it in *page_id.
  // Pages with room are preferred, then empty pages, then a newly allocated
  // page. Rows larger than a page are NotSupported.
  virtual Status InsertDataRow(uint32_t row_size, PageId* page_id) = 0;

  // Releases a row of `row_size` bytes from the page. If it was the last row
  // the page becomes empty and, when page_emptied is not nullptr,
  // *page_emptied is set to true.
  virtual Status RemoveDataRow(PageId page_id, uint32_t row_size,
                               bool* page_emptied) = 0;

  // True if at least one row lives on the page.
  virtual bool HoldsRows(PageId page_id) const = 0;

  // Drops every row of a data page and moves it to the reuse pool.
  // Returns NotFound if the page holds no rows.
  virtual Status EvictDataPage(PageId page_id) = 0;

  virtual void DumpStatistics(Logger* info_log) const = 0;
};

}  // namespace PAGEPOOL_NAMESPACE
