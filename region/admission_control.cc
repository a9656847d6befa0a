//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "region/admission_control.h"

#include <cinttypes>

#include "logging/logging.h"

namespace PAGEPOOL_NAMESPACE {

double EvictionWatermarkPages(const RegionOptions& options,
                              uint32_t system_page_size) {
  const uint64_t capacity_pages = options.max_size / system_page_size;
  return static_cast<double>(capacity_pages) * options.eviction_threshold;
}

Status EnsureFreeSpace(const RegionOptions& options, bool persistence_enabled,
                       PageMemory* page_memory, FreeList* free_list,
                       PageEvictionTracker* tracker, Logger* info_log) {
  if (options.page_eviction_mode == PageEvictionMode::kDisabled ||
      persistence_enabled) {
    return Status::OK();
  }

  const double watermark =
      EvictionWatermarkPages(options, page_memory->SystemPageSize());
  const uint64_t pool_size =
      static_cast<uint64_t>(options.empty_pages_pool_size);

  while (static_cast<double>(page_memory->LoadedPages()) > watermark &&
         free_list->EmptyDataPages() < pool_size) {
    Status s = tracker->EvictDataPage();
    if (!s.ok()) {
      PAGEPOOL_LOG_ERROR(info_log,
                         "Page eviction failed in region %s "
                         "[loaded_pages=%" PRIu64 ", empty_pages=%" PRIu64
                         ", watermark=%.1f]: %s",
                         options.name.c_str(), page_memory->LoadedPages(),
                         free_list->EmptyDataPages(), watermark,
                         s.ToString().c_str());
      return s;
    }
  }
  return Status::OK();
}

}  // namespace PAGEPOOL_NAMESPACE
