//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <string>
#include <unordered_map>

#include "pagepool/options.h"
#include "pagepool/status.h"

namespace PAGEPOOL_NAMESPACE {

// Take a default RegionOptions "base_options" in addition to a
// map "opts_map" of option name to option value to construct the new
// RegionOptions "new_options".
//
// Below are the instructions of how to config some non-primitive-typed
// options in RegionOptions:
//
// * page_eviction_mode:
//   "kDisabled", "kRandomLRU" or "kRandom2LRU".
// * sizes (initial_size, max_size):
//   A number with an optional K, M, G or T suffix, e.g. "512M".
//
// Unknown option names and malformed values make the call return
// InvalidArgument and leave "new_options" untouched.
Status GetRegionOptionsFromMap(
    const RegionOptions& base_options,
    const std::unordered_map<std::string, std::string>& opts_map,
    RegionOptions* new_options);

Status GetMemoryOptionsFromMap(
    const MemoryOptions& base_options,
    const std::unordered_map<std::string, std::string>& opts_map,
    MemoryOptions* new_options);

// Take a string representation of option names and values, apply them into
// the base_options, and return the new options as a result. The string has
// the following format:
//   "name=r1;max_size=512M;page_eviction_mode=kRandom2LRU"
Status GetRegionOptionsFromString(const RegionOptions& base_options,
                                  const std::string& opts_str,
                                  RegionOptions* new_options);

// As GetRegionOptionsFromString. Regions are given as a braced,
// ':'-separated list of nested option strings, each parsed on top of a
// default RegionOptions:
//   "page_size=8K;regions={{name=a;max_size=64M}:{name=b}}"
Status GetMemoryOptionsFromString(const MemoryOptions& base_options,
                                  const std::string& opts_str,
                                  MemoryOptions* new_options);

}  // namespace PAGEPOOL_NAMESPACE
