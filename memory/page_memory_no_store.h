//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stdint.h>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "memory/direct_memory_provider.h"
#include "pagepool/env.h"
#include "pagepool/options.h"
#include "pagepool/page_memory.h"
#include "port/port.h"

namespace PAGEPOOL_NAMESPACE {

class RegionMetricsImpl;

// Page memory of a region without a persistent store behind it. Memory is
// taken from a DirectMemoryProvider in up to kSegmentCount segments: the
// first one of the region's initial size, the others split the remainder
// up to max size. Freed pages are reused before new memory is touched.
class PageMemoryNoStore : public PageMemory {
 public:
  // Bytes in front of every page payload: the page id, an allocation
  // marker and a reserved word.
  static constexpr uint32_t kPageHeaderSize = 24;
  static constexpr size_t kSegmentCount = 16;
  static constexpr uint64_t kMinSegmentSize = 256ull * 1024 * 1024;

  // `metrics` may be nullptr.
  PageMemoryNoStore(const RegionOptions& options, uint32_t page_size,
                    std::unique_ptr<DirectMemoryProvider> provider,
                    RegionMetricsImpl* metrics,
                    std::shared_ptr<Logger> info_log);

  ~PageMemoryNoStore() override;

  // Sizes of the memory segments of a region.
  static std::vector<uint64_t> ComputeSegmentSizes(uint64_t initial_size,
                                                   uint64_t max_size);

  Status Start() override;
  Status Stop() override;

  uint64_t LoadedPages() const override {
    return loaded_pages_.load(std::memory_order_relaxed);
  }
  uint32_t SystemPageSize() const override { return sys_page_size_; }
  uint32_t PageSize() const override { return page_size_; }

  Status AllocatePage(PageId* page_id) override;
  Status FreePage(PageId page_id) override;
  char* PageAddress(PageId page_id) const override;

 private:
  struct Segment {
    char* base;
    uint32_t pages;
  };

  // REQUIRES: mu_ held
  char* PageHeader(PageId page_id) const;
  // REQUIRES: mu_ held
  Status MapNextSegment();

  const std::string name_;
  const uint64_t initial_size_;
  const uint64_t max_size_;
  const uint32_t page_size_;
  const uint32_t sys_page_size_;
  std::unique_ptr<DirectMemoryProvider> provider_;
  RegionMetricsImpl* metrics_;
  std::shared_ptr<Logger> info_log_;

  mutable port::Mutex mu_;
  bool started_;
  std::vector<Segment> segments_;
  // Next never-used page of the last segment.
  uint32_t next_index_;
  std::vector<PageId> recycled_;
  std::atomic<uint64_t> loaded_pages_;
};

}  // namespace PAGEPOOL_NAMESPACE
