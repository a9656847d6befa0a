// Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "options/options_type.h"
#include "pagepool/env.h"
#include "pagepool/options.h"
#include "pagepool/status.h"

namespace PAGEPOOL_NAMESPACE {

extern Status StringToMap(
    const std::string& opts_str,
    std::unordered_map<std::string, std::string>* opts_map);

// Parses "{name=a;max_size=64M}:{name=b}", the value of "regions" with its
// outer braces removed, into a list of regions each starting from `base`.
extern Status ParseRegionOptionsList(const RegionOptions& base,
                                     const std::string& value,
                                     std::vector<RegionOptions>* regions);

struct OptionsHelper {
  static std::unordered_map<std::string, PageEvictionMode>
      page_eviction_mode_string_map;
  static std::unordered_map<std::string, InfoLogLevel>
      info_log_level_string_map;
  static const std::unordered_map<std::string, OptionTypeInfo>
      region_options_type_info;
  static const std::unordered_map<std::string, OptionTypeInfo>
      memory_options_type_info;
};

// Some aliasing
static auto& page_eviction_mode_string_map =
    OptionsHelper::page_eviction_mode_string_map;
static auto& info_log_level_string_map =
    OptionsHelper::info_log_level_string_map;

}  // namespace PAGEPOOL_NAMESPACE
