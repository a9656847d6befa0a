//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <set>
#include <string>

#include "pagepool/options.h"
#include "pagepool/status.h"
#include "port/port.h"

namespace PAGEPOOL_NAMESPACE {

class Logger;

// Checks a MemoryOptions before a registry is built from it and fills in the
// values left unset. Every rule is exposed on its own so that it can be
// exercised in isolation; Validate() applies them in order:
//
//   1. page size (0 becomes kDefaultPageSize)
//   2. system region sizing
//   3. for each user region: name, size, metrics window, eviction settings
//   4. default region resolution
//
// All failures are Status::InvalidArgument naming the offending region and
// value.
class MemoryOptionsValidator {
 public:
  // `address_space_bits` selects whether the 2 GB initial size cap of 32-bit
  // hosts applies. `info_log` receives auto-correction warnings and may be
  // nullptr.
  explicit MemoryOptionsValidator(
      Logger* info_log, int address_space_bits = port::kAddressSpaceBits)
      : info_log_(info_log), address_space_bits_(address_space_bits) {}

  Status Validate(MemoryOptions* options) const;

  void CheckPageSize(MemoryOptions* options) const;

  Status CheckSystemRegionSize(uint64_t initial_size, uint64_t max_size) const;

  // The system region name must be set and must not collide with the name
  // of the default region.
  Status CheckSystemRegionName(const std::string& system_region_name,
                               const std::string& default_region_name) const;

  // Inserts the name into `observed_names` on success.
  Status CheckRegionName(const std::string& name,
                         const std::string& system_region_name,
                         std::set<std::string>* observed_names) const;

  Status CheckRegionSize(RegionOptions* region) const;

  Status CheckMetricsProperties(const RegionOptions& region) const;

  Status CheckEvictionProperties(const RegionOptions& region,
                                 uint32_t page_size) const;

  Status CheckDefaultRegion(const std::string& default_region_name,
                            uint64_t default_region_size,
                            const std::set<std::string>& region_names) const;

 private:
  bool Is32Bit() const { return address_space_bits_ <= 32; }

  Logger* info_log_;
  const int address_space_bits_;
};

}  // namespace PAGEPOOL_NAMESPACE
