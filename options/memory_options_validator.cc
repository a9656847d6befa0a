//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "options/memory_options_validator.h"

#include <cinttypes>

#include "logging/logging.h"
#include "util/string_util.h"

namespace PAGEPOOL_NAMESPACE {

namespace {

std::string Readable(uint64_t bytes) { return BytesToHumanString(bytes); }

}  // namespace

Status MemoryOptionsValidator::Validate(MemoryOptions* options) const {
  CheckPageSize(options);

  Status s = CheckSystemRegionName(options->system_region_name,
                                   options->default_region_name);
  if (s.ok()) {
    s = CheckSystemRegionSize(options->system_region_initial_size,
                              options->system_region_max_size);
  }
  if (!s.ok()) {
    return s;
  }

  std::set<std::string> names;
  for (auto& region : options->regions) {
    s = CheckRegionName(region.name, options->system_region_name, &names);
    if (s.ok()) {
      s = CheckRegionSize(&region);
    }
    if (s.ok()) {
      s = CheckMetricsProperties(region);
    }
    if (s.ok()) {
      if (options->persistence_enabled) {
        if (region.page_eviction_mode != PageEvictionMode::kDisabled) {
          PAGEPOOL_LOG_WARN(
              info_log_,
              "Region %s sets page_eviction_mode=%s, which is ignored when "
              "persistence is enabled",
              region.name.c_str(),
              PageEvictionModeToString(region.page_eviction_mode));
        }
      } else {
        s = CheckEvictionProperties(region, options->page_size);
      }
    }
    if (!s.ok()) {
      return s;
    }
  }

  return CheckDefaultRegion(options->default_region_name,
                            options->default_region_size, names);
}

void MemoryOptionsValidator::CheckPageSize(MemoryOptions* options) const {
  if (options->page_size == 0) {
    options->page_size = kDefaultPageSize;
    PAGEPOOL_LOG_INFO(info_log_, "Page size is not set, using %" PRIu32,
                      options->page_size);
  }
}

Status MemoryOptionsValidator::CheckSystemRegionSize(uint64_t initial_size,
                                                     uint64_t max_size) const {
  if (initial_size < kMinRegionSize) {
    return Status::InvalidArgument(
        "Initial size of the system region must be at least " +
            Readable(kMinRegionSize) +
            " (use MemoryOptions::system_region_initial_size)",
        "size=" + Readable(initial_size));
  }
  if (Is32Bit() && initial_size > kMaxInitialSize32Bit) {
    return Status::InvalidArgument(
        "Initial size of the system region exceeds " +
            Readable(kMaxInitialSize32Bit) + " on a 32-bit address space",
        "size=" + Readable(initial_size));
  }
  if (max_size < initial_size) {
    return Status::InvalidArgument(
        "Max size of the system region must not be smaller than its initial "
        "size (use MemoryOptions::system_region_initial_size and "
        "MemoryOptions::system_region_max_size)",
        "initial_size=" + Readable(initial_size) +
            ", max_size=" + Readable(max_size));
  }
  return Status::OK();
}

Status MemoryOptionsValidator::CheckSystemRegionName(
    const std::string& system_region_name,
    const std::string& default_region_name) const {
  if (system_region_name.empty()) {
    return Status::InvalidArgument("System region must have a non-empty name");
  }
  if (system_region_name == default_region_name ||
      system_region_name == kDefaultRegionName) {
    return Status::InvalidArgument(
        "System region name collides with the default region name",
        system_region_name);
  }
  return Status::OK();
}

Status MemoryOptionsValidator::CheckRegionName(
    const std::string& name, const std::string& system_region_name,
    std::set<std::string>* observed_names) const {
  if (name.empty()) {
    return Status::InvalidArgument("Region must have a non-empty name");
  }
  if (observed_names->count(name) != 0) {
    return Status::InvalidArgument("Two regions have the same name", name);
  }
  if (name == system_region_name) {
    return Status::InvalidArgument("Region name is reserved for internal use",
                                   name);
  }
  observed_names->insert(name);
  return Status::OK();
}

Status MemoryOptionsValidator::CheckRegionSize(RegionOptions* region) const {
  bool default_initial_size = false;
  if (region->initial_size == 0) {
    region->initial_size = kDefaultRegionInitialSize;
    default_initial_size = true;
  }

  if (region->initial_size < kMinRegionSize) {
    return Status::InvalidArgument(
        "Region initial size must be at least " + Readable(kMinRegionSize),
        "name=" + region->name + ", size=" + Readable(region->initial_size));
  }

  if (region->max_size < region->initial_size) {
    if (default_initial_size) {
      // The initial size was never asked for, so fit it under the max size.
      region->initial_size = region->max_size;
      PAGEPOOL_LOG_WARN(info_log_,
                        "Region %s max_size=%s is smaller than the default "
                        "initial size %s, setting initial_size to %s",
                        region->name.c_str(),
                        Readable(region->max_size).c_str(),
                        Readable(kDefaultRegionInitialSize).c_str(),
                        Readable(region->max_size).c_str());
    } else {
      return Status::InvalidArgument(
          "Region max size must not be smaller than its initial size",
          "name=" + region->name +
              ", initial_size=" + Readable(region->initial_size) +
              ", max_size=" + Readable(region->max_size));
    }
  }

  if (Is32Bit() && region->initial_size > kMaxInitialSize32Bit) {
    return Status::InvalidArgument(
        "Region initial size exceeds " + Readable(kMaxInitialSize32Bit) +
            " on a 32-bit address space",
        "name=" + region->name + ", size=" + Readable(region->initial_size));
  }
  return Status::OK();
}

Status MemoryOptionsValidator::CheckMetricsProperties(
    const RegionOptions& region) const {
  if (region.rate_time_interval_ms <= 0) {
    return Status::InvalidArgument(
        "Rate time interval must be greater than zero",
        "name=" + region.name + ", rate_time_interval_ms=" +
            std::to_string(region.rate_time_interval_ms));
  }
  if (region.sub_intervals <= 0) {
    return Status::InvalidArgument(
        "Sub intervals must be greater than zero",
        "name=" + region.name +
            ", sub_intervals=" + std::to_string(region.sub_intervals));
  }
  if (region.rate_time_interval_ms < 1000) {
    return Status::InvalidArgument(
        "Rate time interval must be at least 1000 milliseconds",
        "name=" + region.name + ", rate_time_interval_ms=" +
            std::to_string(region.rate_time_interval_ms));
  }
  return Status::OK();
}

Status MemoryOptionsValidator::CheckEvictionProperties(
    const RegionOptions& region, uint32_t page_size) const {
  if (region.page_eviction_mode == PageEvictionMode::kDisabled) {
    return Status::OK();
  }

  if (region.eviction_threshold < 0.5 || region.eviction_threshold > 0.999) {
    return Status::InvalidArgument(
        "Page eviction threshold must be between 0.5 and 0.999",
        "name=" + region.name +
            ", eviction_threshold=" +
            ToStringWithPrecision(region.eviction_threshold));
  }

  if (region.empty_pages_pool_size <= 10) {
    return Status::InvalidArgument(
        "Empty pages pool size must be greater than 10",
        "name=" + region.name + ", empty_pages_pool_size=" +
            std::to_string(region.empty_pages_pool_size));
  }

  const uint64_t effective_page_size =
      page_size == 0 ? kDefaultPageSize : page_size;
  const uint64_t max_pool_size = region.max_size / effective_page_size / 10;
  if (static_cast<uint64_t>(region.empty_pages_pool_size) >= max_pool_size) {
    return Status::InvalidArgument(
        "Empty pages pool size must be less than " +
            std::to_string(max_pool_size),
        "name=" + region.name + ", empty_pages_pool_size=" +
            std::to_string(region.empty_pages_pool_size));
  }
  return Status::OK();
}

Status MemoryOptionsValidator::CheckDefaultRegion(
    const std::string& default_region_name, uint64_t default_region_size,
    const std::set<std::string>& region_names) const {
  if (default_region_size != 0) {
    if (default_region_name != kDefaultRegionName) {
      return Status::InvalidArgument(
          "A user-defined default region and default_region_size are set at "
          "the same time; remove one of them",
          "default_region_name=" + default_region_name);
    }
    if (default_region_size < kMinRegionSize) {
      return Status::InvalidArgument(
          "Default region size must be at least " + Readable(kMinRegionSize),
          "size=" + Readable(default_region_size));
    }
    if (Is32Bit() && default_region_size > kMaxInitialSize32Bit) {
      return Status::InvalidArgument(
          "Default region size exceeds " + Readable(kMaxInitialSize32Bit) +
              " on a 32-bit address space",
          "size=" + Readable(default_region_size));
    }
  }

  if (default_region_name != kDefaultRegionName) {
    if (default_region_name.empty()) {
      return Status::InvalidArgument("Default region name must be non-empty");
    }
    if (region_names.count(default_region_name) == 0) {
      return Status::InvalidArgument(
          "Default region name must be one of the configured regions",
          default_region_name);
    }
  }
  return Status::OK();
}

}  // namespace PAGEPOOL_NAMESPACE
