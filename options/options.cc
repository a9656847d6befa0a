//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).
//
// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#include "pagepool/options.h"

#include <cinttypes>

#include <algorithm>

#include "logging/logging.h"
#include "pagepool/env.h"
#include "port/port.h"
#include "util/string_util.h"

namespace PAGEPOOL_NAMESPACE {

const char* kDefaultRegionName = "default";
const char* kDefaultSystemRegionName = "sysMemPlc";

const char* PageEvictionModeToString(PageEvictionMode mode) {
  switch (mode) {
    case PageEvictionMode::kDisabled:
      return "kDisabled";
    case PageEvictionMode::kRandomLRU:
      return "kRandomLRU";
    case PageEvictionMode::kRandom2LRU:
      return "kRandom2LRU";
  }
  return "kUnknown";
}

uint64_t DefaultRegionMaxSize() {
  uint64_t physical = port::GetPhysicalMemorySize();
  uint64_t max_size = static_cast<uint64_t>(physical * 0.8);
  return std::max(max_size, kDefaultRegionInitialSize);
}

RegionOptions::RegionOptions() : max_size(DefaultRegionMaxSize()) {}

RegionOptions::RegionOptions(const std::string& _name) : RegionOptions() {
  name = _name;
}

void RegionOptions::Dump(Logger* log) const {
  PAGEPOOL_LOG_HEADER(log, "                  Region[%s].initial_size: %s",
                      name.c_str(), BytesToHumanString(initial_size).c_str());
  PAGEPOOL_LOG_HEADER(log, "                      Region[%s].max_size: %s",
                      name.c_str(), BytesToHumanString(max_size).c_str());
  PAGEPOOL_LOG_HEADER(log, "            Region[%s].page_eviction_mode: %s",
                      name.c_str(),
                      PageEvictionModeToString(page_eviction_mode));
  PAGEPOOL_LOG_HEADER(log, "            Region[%s].eviction_threshold: %.3f",
                      name.c_str(), eviction_threshold);
  PAGEPOOL_LOG_HEADER(log, "         Region[%s].empty_pages_pool_size: %d",
                      name.c_str(), empty_pages_pool_size);
  PAGEPOOL_LOG_HEADER(log, "                Region[%s].swap_file_path: %s",
                      name.c_str(),
                      swap_file_path.empty() ? "(anonymous memory)"
                                             : swap_file_path.c_str());
  PAGEPOOL_LOG_HEADER(log, "               Region[%s].metrics_enabled: %d",
                      name.c_str(), metrics_enabled);
  PAGEPOOL_LOG_HEADER(log,
                      "         Region[%s].rate_time_interval_ms: %" PRId64,
                      name.c_str(), rate_time_interval_ms);
  PAGEPOOL_LOG_HEADER(log, "                 Region[%s].sub_intervals: %d",
                      name.c_str(), sub_intervals);
}

MemoryOptions::MemoryOptions()
    : default_region_name(kDefaultRegionName),
      system_region_name(kDefaultSystemRegionName),
      env(Env::Default()) {}

RegionOptions MemoryOptions::CreateDefaultRegionOptions() const {
  RegionOptions res(kDefaultRegionName);
  res.max_size =
      default_region_size != 0 ? default_region_size : DefaultRegionMaxSize();
  res.initial_size = std::min(kDefaultRegionInitialSize, res.max_size);
  return res;
}

RegionOptions MemoryOptions::CreateSystemRegionOptions() const {
  RegionOptions res(system_region_name);
  res.initial_size = system_region_initial_size;
  res.max_size = system_region_max_size;
  return res;
}

void MemoryOptions::Dump(Logger* log) const {
  PAGEPOOL_LOG_HEADER(log, "                  Options.page_size: %" PRIu32,
                      EffectivePageSize());
  PAGEPOOL_LOG_HEADER(log, "        Options.default_region_name: %s",
                      default_region_name.c_str());
  PAGEPOOL_LOG_HEADER(log, "        Options.default_region_size: %s",
                      default_region_size == 0
                          ? "(not set)"
                          : BytesToHumanString(default_region_size).c_str());
  PAGEPOOL_LOG_HEADER(log, " Options.system_region_initial_size: %s",
                      BytesToHumanString(system_region_initial_size).c_str());
  PAGEPOOL_LOG_HEADER(log, "     Options.system_region_max_size: %s",
                      BytesToHumanString(system_region_max_size).c_str());
  PAGEPOOL_LOG_HEADER(log, "         Options.system_region_name: %s",
                      system_region_name.c_str());
  PAGEPOOL_LOG_HEADER(log, "Options.override_fair_fifo_eviction: %d",
                      override_fair_fifo_eviction);
  PAGEPOOL_LOG_HEADER(log, "        Options.persistence_enabled: %d",
                      persistence_enabled);
  PAGEPOOL_LOG_HEADER(log, "                   Options.work_dir: %s",
                      work_dir.c_str());
  PAGEPOOL_LOG_HEADER(log, "              Options.consistent_id: %s",
                      consistent_id.c_str());
  PAGEPOOL_LOG_HEADER(log, "                        Options.env: %p", env);
  PAGEPOOL_LOG_HEADER(log, "                   Options.info_log: %p",
                      info_log.get());
  PAGEPOOL_LOG_HEADER(log,
                      "                    Options.regions: %" PAGEPOOL_PRIszt,
                      regions.size());
  for (const auto& region : regions) {
    region.Dump(log);
  }
}

}  // namespace PAGEPOOL_NAMESPACE
