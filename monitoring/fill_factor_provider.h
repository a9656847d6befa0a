//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stdint.h>

#include <atomic>
#include <string>
#include <utility>

#include "pagepool/free_list.h"

namespace PAGEPOOL_NAMESPACE {

// Looks up the free list of a region by name. Returns nullptr while the
// region has none.
class FreeListResolver {
 public:
  virtual ~FreeListResolver() {}
  virtual FreeList* ResolveFreeList(const std::string& region_name) = 0;
};

// Computes the pages fill factor of one region. The free list is resolved
// on first use and cached; until it exists the fill factor is 0. Never owns
// the free list.
class FillFactorProvider {
 public:
  FillFactorProvider(std::string region_name, FreeListResolver* resolver)
      : region_name_(std::move(region_name)),
        resolver_(resolver),
        free_list_(nullptr) {}

  double GetFillFactor() {
    FreeList* free_list = free_list_.load(std::memory_order_acquire);
    if (free_list == nullptr) {
      if (resolver_ == nullptr) {
        return 0.0;
      }
      free_list = resolver_->ResolveFreeList(region_name_);
      if (free_list == nullptr) {
        return 0.0;
      }
      free_list_.store(free_list, std::memory_order_release);
    }
    uint64_t used = 0;
    uint64_t total = 0;
    free_list->GetFillFactor(&used, &total);
    return ComputeFillFactor(used, total);
  }

  static double ComputeFillFactor(uint64_t used, uint64_t total) {
    if (total == 0) {
      return 0.0;
    }
    return static_cast<double>(used) / static_cast<double>(total);
  }

 private:
  const std::string region_name_;
  FreeListResolver* const resolver_;
  std::atomic<FreeList*> free_list_;
};

}  // namespace PAGEPOOL_NAMESPACE
