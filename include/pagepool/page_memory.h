//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stdint.h>

#include "pagepool/pagepool_namespace.h"
#include "pagepool/status.h"

namespace PAGEPOOL_NAMESPACE {

// Identifies a page within one PageMemory. The upper 32 bits hold the index
// of the memory segment, the lower 32 bits the index of the page in it.
using PageId = uint64_t;

inline PageId MakePageId(uint32_t segment, uint32_t index) {
  return (static_cast<uint64_t>(segment) << 32) | index;
}
inline uint32_t PageSegment(PageId id) {
  return static_cast<uint32_t>(id >> 32);
}
inline uint32_t PageIndex(PageId id) { return static_cast<uint32_t>(id); }

// The pages of one region. Every page carries a fixed header in front of
// its PageSize() bytes of payload; SystemPageSize() is the full footprint
// and is the unit the region budget is accounted in.
//
// Implementations are safe for concurrent use once Start() has returned.
class PageMemory {
 public:
  virtual ~PageMemory() {}

  // Maps the initial memory of the region.
  virtual Status Start() = 0;

  // Releases all memory. Pages handed out before are invalid afterwards.
  virtual Status Stop() = 0;

  // Number of pages allocated and not freed.
  virtual uint64_t LoadedPages() const = 0;

  // Payload size of a page plus its header.
  virtual uint32_t SystemPageSize() const = 0;

  // Payload size of a page.
  virtual uint32_t PageSize() const = 0;

  // Returns Aborted once the region has no memory left.
  virtual Status AllocatePage(PageId* page_id) = 0;

  virtual Status FreePage(PageId page_id) = 0;

  // Address of the payload of an allocated page, or nullptr if the page is
  // not allocated.
  virtual char* PageAddress(PageId page_id) const = 0;
};

}  // namespace PAGEPOOL_NAMESPACE
