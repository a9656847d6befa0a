//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).
//
// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "pagepool/env.h"
#include "pagepool/pagepool_namespace.h"

namespace PAGEPOOL_NAMESPACE {

class Logger;

// How data pages of a region are picked for eviction once the region grows
// past its eviction threshold.
enum class PageEvictionMode : unsigned char {
  // Never evict. Allocation beyond max_size fails.
  kDisabled = 0x0,
  // Sample a handful of random pages and evict the least recently touched.
  kRandomLRU = 0x1,
  // Like kRandomLRU, but a page is ranked by the older of its two latest
  // access times, which protects pages touched more than once.
  kRandom2LRU = 0x2,
};

extern const char* PageEvictionModeToString(PageEvictionMode mode);

// Sizes are in bytes.
constexpr uint32_t kDefaultPageSize = 4 * 1024;
constexpr uint64_t kMinRegionSize = 10ull * 1024 * 1024;
constexpr uint64_t kMaxInitialSize32Bit = 2ull * 1024 * 1024 * 1024;
constexpr uint64_t kDefaultRegionInitialSize = 256ull * 1024 * 1024;
constexpr uint64_t kDefaultSystemRegionInitialSize = 40ull * 1024 * 1024;
constexpr uint64_t kDefaultSystemRegionMaxSize = 100ull * 1024 * 1024;

extern const char* kDefaultRegionName;        // "default"
extern const char* kDefaultSystemRegionName;  // "sysMemPlc"

// 80% of the physical memory of the host, but never less than
// kDefaultRegionInitialSize.
extern uint64_t DefaultRegionMaxSize();

// Configuration of a single memory region.
struct RegionOptions {
  // Unique, non-empty name of the region.
  std::string name;

  // Memory mapped when the region starts. 0 means kDefaultRegionInitialSize;
  // when max_size is smaller than that default, the initial size is lowered
  // to max_size.
  //
  // Default: 0
  uint64_t initial_size = 0;

  // Upper bound of the memory the region may hold. Page eviction, when
  // enabled, keeps the region below eviction_threshold of this value.
  //
  // Default: DefaultRegionMaxSize()
  uint64_t max_size;

  // Default: kDisabled
  PageEvictionMode page_eviction_mode = PageEvictionMode::kDisabled;

  // Fraction of max_size above which pages are evicted before each
  // allocation. Must be within [0.5, 0.999] when eviction is enabled.
  //
  // Default: 0.9
  double eviction_threshold = 0.9;

  // Eviction stops once this many pages are empty and ready for reuse.
  // Must be greater than 10 and less than max_size / page_size / 10 when
  // eviction is enabled.
  //
  // Default: 100
  int empty_pages_pool_size = 100;

  // If non-empty, pages are backed by memory-mapped files in this directory
  // instead of anonymous memory. Relative paths are resolved against
  // MemoryOptions::work_dir.
  //
  // Default: ""
  std::string swap_file_path;

  // Whether allocation/eviction counters are collected from the start.
  // Can be toggled at runtime through RegionMetrics.
  //
  // Default: false
  bool metrics_enabled = false;

  // Length of the sliding window of the allocation and eviction rates.
  // Must be at least 1000.
  //
  // Default: 60000
  int64_t rate_time_interval_ms = 60000;

  // Number of buckets the rate window is split into. Must be positive.
  //
  // Default: 5
  int sub_intervals = 5;

  RegionOptions();
  explicit RegionOptions(const std::string& _name);

  void Dump(Logger* log) const;
};

// Configuration shared by all regions of a registry.
struct MemoryOptions {
  // Size of a data page. 0 means kDefaultPageSize.
  //
  // Default: 0
  uint32_t page_size = 0;

  // User-defined regions. A region named default_region_name becomes the
  // default region; if none does and default_region_name is
  // kDefaultRegionName, one is synthesized.
  std::vector<RegionOptions> regions;

  // Name of the region returned for lookups without a name. A value other
  // than kDefaultRegionName must name one of `regions`.
  //
  // Default: "default"
  std::string default_region_name;

  // Max size of the synthesized default region. 0 means not set. Cannot be
  // combined with a non-default default_region_name.
  //
  // Default: 0
  uint64_t default_region_size = 0;

  // Sizing of the reserved system region.
  uint64_t system_region_initial_size = kDefaultSystemRegionInitialSize;
  uint64_t system_region_max_size = kDefaultSystemRegionMaxSize;

  // Name reserved for the system region. User regions may not use it.
  //
  // Default: "sysMemPlc"
  std::string system_region_name;

  // Use first-touch-order eviction for every eviction-enabled region
  // regardless of its page_eviction_mode. Experimental.
  //
  // Default: false
  bool override_fair_fifo_eviction = false;

  // Regions are backed by a persistent store that does its own page
  // replacement. Eviction is not performed and its settings are not checked.
  //
  // Default: false
  bool persistence_enabled = false;

  // Base directory for relative swap_file_path values.
  //
  // Default: ""
  std::string work_dir;

  // Identifier of the local node. Names the per-node sub-directory of swap
  // paths, with ':', ',' and '.' replaced by '_'.
  //
  // Default: ""
  std::string consistent_id;

  // Used to access the file system and the clock.
  //
  // Default: Env::Default()
  Env* env;

  // Any internal progress/error information generated by the registry will
  // be written to info_log if it is non-nullptr, or to stderr otherwise.
  //
  // Default: nullptr
  std::shared_ptr<Logger> info_log;

  InfoLogLevel info_log_level = InfoLogLevel::INFO_LEVEL;

  MemoryOptions();

  // Effective page size: page_size, or kDefaultPageSize if unset.
  uint32_t EffectivePageSize() const {
    return page_size == 0 ? kDefaultPageSize : page_size;
  }

  // The region synthesized when no user region is named the default. Its
  // max size is default_region_size if set, DefaultRegionMaxSize()
  // otherwise, and its initial size is the smaller of that and
  // kDefaultRegionInitialSize.
  RegionOptions CreateDefaultRegionOptions() const;

  // The reserved system region.
  RegionOptions CreateSystemRegionOptions() const;

  void Dump(Logger* log) const;
};

}  // namespace PAGEPOOL_NAMESPACE
