//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "monitoring/fill_factor_provider.h"
#include "pagepool/options.h"
#include "pagepool/region_registry.h"
#include "port/port.h"
#include "region/region_impl.h"

namespace PAGEPOOL_NAMESPACE {

// Directory the pages of a region with a swap_file_path are mapped from:
// swap_file_path, resolved against work_dir when relative, followed by a
// per-node sub-directory named after consistent_id with ':', ',' and '.'
// replaced by '_', or "local" without a consistent_id.
extern std::string SwapDirectory(const MemoryOptions& options,
                                 const RegionOptions& region);

class RegionRegistryImpl : public RegionRegistry, public FreeListResolver {
 public:
  explicit RegionRegistryImpl(const MemoryOptions& options);

  ~RegionRegistryImpl() override;

  // Validates the options, builds every region and starts them.
  Status Start();

  void Deactivate() override;

  bool IsActive() const override {
    return active_.load(std::memory_order_acquire);
  }

  Status GetRegion(Region** region) override;
  Status GetRegion(const std::string& name, Region** region) override;

  Status GetFreeList(FreeList** free_list) override;
  Status GetFreeList(const std::string& name, FreeList** free_list) override;

  Status GetReuseList(ReuseList** reuse_list) override;
  Status GetReuseList(const std::string& name,
                      ReuseList** reuse_list) override;

  std::vector<Region*> GetRegions() const override;

  Status EnsureFreeSpace(Region* region) override;

  std::vector<RegionMetricsSnapshot> GetMetricsSnapshots() const override;

  Status GetMetricsSnapshot(const std::string& name,
                            RegionMetricsSnapshot* snapshot) const override;

  const std::string& SystemRegionName() const override {
    return options_.system_region_name;
  }

  const std::string& DefaultRegionName() const override {
    return options_.default_region_name;
  }

  uint32_t PageSize() const override { return options_.EffectivePageSize(); }

  bool PersistenceEnabled() const override {
    return options_.persistence_enabled;
  }

  void DumpStatistics() override;

  FreeList* ResolveFreeList(const std::string& region_name) override;

  // The options after validation filled in their defaults.
  const MemoryOptions& GetOptions() const { return options_; }

  Logger* GetLogger() const { return info_log_.get(); }

#ifndef NDEBUG
  Status TEST_AddRegion(const RegionOptions& region_options, bool is_default) {
    return AddRegion(region_options, is_default);
  }
#endif  // !NDEBUG

 private:
  // Adds the default region if needed, the user regions and the system
  // region, in that order.
  Status InitRegions();

  Status AddRegion(const RegionOptions& region_options, bool is_default);

  Status FindRegion(const std::string& name, RegionImpl** region) const;

  // Stops every started region in reverse order of creation.
  void StopRegions();

  MemoryOptions options_;
  std::shared_ptr<Logger> info_log_;
  std::atomic<bool> active_;

  std::vector<std::unique_ptr<RegionImpl>> regions_;
  std::map<std::string, RegionImpl*> regions_by_name_;
  RegionImpl* default_region_;

  // Free lists visible to the metrics fill factor; filled once every region
  // started.
  port::Mutex free_lists_mu_;
  std::map<std::string, FreeList*> free_lists_;
};

}  // namespace PAGEPOOL_NAMESPACE
