//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "pagepool/free_list.h"
#include "pagepool/options.h"
#include "pagepool/region.h"
#include "pagepool/region_metrics.h"
#include "pagepool/status.h"

namespace PAGEPOOL_NAMESPACE {

// Owns the memory regions built from one MemoryOptions.
//
// Activation and deactivation must be serialized by the caller. Lookups may
// run concurrently with each other but not with Deactivate().
class RegionRegistry {
 public:
  // Validates `options`, builds one region per configured region plus the
  // default region (synthesized if needed) and the system region, and
  // starts them all. On failure every region already started is stopped
  // and *registry is left untouched.
  static Status Activate(const MemoryOptions& options,
                         std::unique_ptr<RegionRegistry>* registry);

  RegionRegistry() {}
  // No copying allowed
  RegionRegistry(const RegionRegistry&) = delete;
  void operator=(const RegionRegistry&) = delete;

  virtual ~RegionRegistry() {}

  // Stops every region and drops them. Safe to call more than once.
  virtual void Deactivate() = 0;

  virtual bool IsActive() const = 0;

  // Returns the default region.
  virtual Status GetRegion(Region** region) = 0;

  // Returns NotFound for an unknown name and ShutdownInProgress once the
  // registry is deactivated.
  virtual Status GetRegion(const std::string& name, Region** region) = 0;

  virtual Status GetFreeList(FreeList** free_list) = 0;
  virtual Status GetFreeList(const std::string& name,
                             FreeList** free_list) = 0;

  virtual Status GetReuseList(ReuseList** reuse_list) = 0;
  virtual Status GetReuseList(const std::string& name,
                              ReuseList** reuse_list) = 0;

  // All regions, including the system region. Empty once deactivated.
  virtual std::vector<Region*> GetRegions() const = 0;

  // Evicts pages of `region` until it is under its eviction threshold or
  // enough empty pages are pooled. No-op for a nullptr region.
  virtual Status EnsureFreeSpace(Region* region) = 0;

  virtual std::vector<RegionMetricsSnapshot> GetMetricsSnapshots() const = 0;

  virtual Status GetMetricsSnapshot(const std::string& name,
                                    RegionMetricsSnapshot* snapshot) const = 0;

  virtual const std::string& SystemRegionName() const = 0;

  virtual const std::string& DefaultRegionName() const = 0;

  virtual uint32_t PageSize() const = 0;

  virtual bool PersistenceEnabled() const = 0;

  // Writes free list statistics of every region to the info log.
  virtual void DumpStatistics() = 0;
};

}  // namespace PAGEPOOL_NAMESPACE
