//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "region/region_registry_impl.h"

#include <cinttypes>

#include "logging/logging.h"
#include "options/memory_options_validator.h"
#include "util/mutexlock.h"
#include "util/stderr_logger.h"
#include "util/string_util.h"

namespace PAGEPOOL_NAMESPACE {

std::string SwapDirectory(const MemoryOptions& options,
                          const RegionOptions& region) {
  std::string dir = region.swap_file_path;
  if (!options.work_dir.empty() && !StartsWith(dir, "/")) {
    dir = options.work_dir + "/" + dir;
  }
  if (options.consistent_id.empty()) {
    return dir + "/local";
  }
  return dir + "/" + ReplaceChars(options.consistent_id, ":,.", '_');
}

Status RegionRegistry::Activate(const MemoryOptions& options,
                                std::unique_ptr<RegionRegistry>* registry) {
  std::unique_ptr<RegionRegistryImpl> impl(new RegionRegistryImpl(options));
  Status s = impl->Start();
  if (s.ok()) {
    registry->reset(impl.release());
  }
  return s;
}

RegionRegistryImpl::RegionRegistryImpl(const MemoryOptions& options)
    : options_(options),
      info_log_(options.info_log),
      active_(false),
      default_region_(nullptr) {
  if (info_log_ == nullptr) {
    info_log_ = std::make_shared<StderrLogger>(options_.info_log_level);
  }
  if (options_.env == nullptr) {
    options_.env = Env::Default();
  }
}

RegionRegistryImpl::~RegionRegistryImpl() { Deactivate(); }

Status RegionRegistryImpl::Start() {
  Status s = MemoryOptionsValidator(info_log_.get()).Validate(&options_);
  if (!s.ok()) {
    PAGEPOOL_LOG_ERROR(info_log_, "Invalid memory options: %s",
                       s.ToString().c_str());
    return s;
  }
  options_.Dump(info_log_.get());

  s = InitRegions();
  if (!s.ok()) {
    regions_by_name_.clear();
    regions_.clear();
    default_region_ = nullptr;
    return s;
  }

  for (size_t i = 0; i < regions_.size(); ++i) {
    s = regions_[i]->Start();
    if (!s.ok()) {
      PAGEPOOL_LOG_ERROR(info_log_, "Failed to start region %s: %s",
                         regions_[i]->Name().c_str(), s.ToString().c_str());
      StopRegions();
      regions_by_name_.clear();
      regions_.clear();
      default_region_ = nullptr;
      return s;
    }
  }

  {
    MutexLock l(&free_lists_mu_);
    for (const auto& region : regions_) {
      free_lists_[region->Name()] = region->GetFreeList();
    }
  }
  active_.store(true, std::memory_order_release);
  PAGEPOOL_LOG_INFO(info_log_,
                    "Activated region registry [regions=%" PAGEPOOL_PRIszt
                    ", default=%s, page_size=%" PRIu32 "]",
                    regions_.size(), options_.default_region_name.c_str(),
                    options_.EffectivePageSize());
  return Status::OK();
}

Status RegionRegistryImpl::InitRegions() {
  Status s;
  if (options_.regions.empty()) {
    PAGEPOOL_LOG_WARN(info_log_,
                      "No user-defined default region found, a new region "
                      "will be created [name=%s]",
                      kDefaultRegionName);
    s = AddRegion(options_.CreateDefaultRegionOptions(), true);
  } else if (options_.default_region_name == kDefaultRegionName) {
    bool found = false;
    for (const auto& region : options_.regions) {
      if (region.name == kDefaultRegionName) {
        found = true;
        break;
      }
    }
    if (!found) {
      PAGEPOOL_LOG_WARN(info_log_,
                        "No user-defined default region found, a new region "
                        "will be created [name=%s]",
                        kDefaultRegionName);
      s = AddRegion(options_.CreateDefaultRegionOptions(), true);
    }
  }

  for (size_t i = 0; s.ok() && i < options_.regions.size(); ++i) {
    const RegionOptions& region = options_.regions[i];
    bool is_default = region.name == options_.default_region_name;
    if (!is_default && region.name == kDefaultRegionName) {
      PAGEPOOL_LOG_WARN(info_log_,
                        "Region %s is not used as the default region "
                        "[default_region_name=%s]",
                        region.name.c_str(),
                        options_.default_region_name.c_str());
    }
    s = AddRegion(region, is_default);
  }

  if (s.ok()) {
    s = AddRegion(options_.CreateSystemRegionOptions(), false);
  }
  return s;
}

Status RegionRegistryImpl::AddRegion(const RegionOptions& region_options,
                                     bool is_default) {
  if (regions_by_name_.count(region_options.name) != 0) {
    return Status::InvalidArgument("Region name is already in use",
                                   region_options.name);
  }
  std::unique_ptr<DirectMemoryProvider> provider;
  if (region_options.swap_file_path.empty()) {
    provider.reset(new AnonymousMemoryProvider());
  } else {
    std::string dir = SwapDirectory(options_, region_options);
    Status s = options_.env->CreateDirRecursively(dir);
    if (!s.ok()) {
      return Status::IOError(
          "Failed to create swap directory of region " + region_options.name,
          dir + ": " + s.ToString());
    }
    provider.reset(
        new MappedFileMemoryProvider(options_.env, dir, info_log_));
  }

  PageEvictionTrackerType tracker_type = SelectPageEvictionTracker(
      region_options.page_eviction_mode, options_.persistence_enabled,
      options_.override_fair_fifo_eviction);

  std::unique_ptr<RegionImpl> region(new RegionImpl(
      region_options, options_.EffectivePageSize(), is_default,
      options_.persistence_enabled, tracker_type, std::move(provider), this,
      options_.env->GetSystemClock().get(), info_log_));
  if (is_default) {
    default_region_ = region.get();
  }
  regions_by_name_[region->Name()] = region.get();
  regions_.push_back(std::move(region));
  return Status::OK();
}

void RegionRegistryImpl::StopRegions() {
  for (auto it = regions_.rbegin(); it != regions_.rend(); ++it) {
    // Failures are logged by the region.
    (*it)->Stop().PermitUncheckedError();
  }
}

void RegionRegistryImpl::Deactivate() {
  if (!active_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  {
    MutexLock l(&free_lists_mu_);
    free_lists_.clear();
  }
  StopRegions();
  default_region_ = nullptr;
  regions_by_name_.clear();
  regions_.clear();
  PAGEPOOL_LOG_INFO(info_log_, "Deactivated region registry");
}

Status RegionRegistryImpl::FindRegion(const std::string& name,
                                      RegionImpl** region) const {
  if (!IsActive()) {
    return Status::ShutdownInProgress("Region registry is not active");
  }
  auto it = regions_by_name_.find(name);
  if (it == regions_by_name_.end()) {
    return Status::NotFound("Requested region is not configured", name);
  }
  *region = it->second;
  return Status::OK();
}

Status RegionRegistryImpl::GetRegion(Region** region) {
  return GetRegion(options_.default_region_name, region);
}

Status RegionRegistryImpl::GetRegion(const std::string& name,
                                     Region** region) {
  RegionImpl* impl = nullptr;
  Status s = FindRegion(name, &impl);
  if (s.ok()) {
    *region = impl;
  }
  return s;
}

Status RegionRegistryImpl::GetFreeList(FreeList** free_list) {
  return GetFreeList(options_.default_region_name, free_list);
}

Status RegionRegistryImpl::GetFreeList(const std::string& name,
                                       FreeList** free_list) {
  RegionImpl* impl = nullptr;
  Status s = FindRegion(name, &impl);
  if (s.ok()) {
    *free_list = impl->GetFreeList();
  }
  return s;
}

Status RegionRegistryImpl::GetReuseList(ReuseList** reuse_list) {
  return GetReuseList(options_.default_region_name, reuse_list);
}

Status RegionRegistryImpl::GetReuseList(const std::string& name,
                                        ReuseList** reuse_list) {
  FreeList* free_list = nullptr;
  Status s = GetFreeList(name, &free_list);
  if (s.ok()) {
    *reuse_list = free_list;
  }
  return s;
}

std::vector<Region*> RegionRegistryImpl::GetRegions() const {
  std::vector<Region*> res;
  if (!IsActive()) {
    return res;
  }
  for (const auto& region : regions_) {
    res.push_back(region.get());
  }
  return res;
}

Status RegionRegistryImpl::EnsureFreeSpace(Region* region) {
  if (region == nullptr) {
    return Status::OK();
  }
  RegionImpl* impl = nullptr;
  Status s = FindRegion(region->Name(), &impl);
  if (!s.ok()) {
    return s;
  }
  if (impl != region) {
    return Status::InvalidArgument("Region does not belong to this registry",
                                   region->Name());
  }
  return impl->EnsureFreeSpace();
}

std::vector<RegionMetricsSnapshot> RegionRegistryImpl::GetMetricsSnapshots()
    const {
  std::vector<RegionMetricsSnapshot> res;
  if (!IsActive()) {
    return res;
  }
  for (const auto& region : regions_) {
    res.push_back(region->GetMetricsSnapshot());
  }
  return res;
}

Status RegionRegistryImpl::GetMetricsSnapshot(
    const std::string& name, RegionMetricsSnapshot* snapshot) const {
  RegionImpl* impl = nullptr;
  Status s = FindRegion(name, &impl);
  if (s.ok()) {
    *snapshot = impl->GetMetricsSnapshot();
  }
  return s;
}

void RegionRegistryImpl::DumpStatistics() {
  if (!IsActive()) {
    return;
  }
  for (const auto& region : regions_) {
    region->GetFreeList()->DumpStatistics(info_log_.get());
    PAGEPOOL_LOG_INFO(info_log_, "%s",
                      region->GetMetricsSnapshot().ToString().c_str());
  }
}

FreeList* RegionRegistryImpl::ResolveFreeList(const std::string& region_name) {
  MutexLock l(&free_lists_mu_);
  auto it = free_lists_.find(region_name);
  return it == free_lists_.end() ? nullptr : it->second;
}

}  // namespace PAGEPOOL_NAMESPACE
