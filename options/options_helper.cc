// Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "options/options_helper.h"

#include <cassert>
#include <cctype>
#include <cstddef>
#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

#include "pagepool/convenience.h"
#include "util/string_util.h"

namespace PAGEPOOL_NAMESPACE {

std::unordered_map<std::string, PageEvictionMode>
    OptionsHelper::page_eviction_mode_string_map = {
        {"kDisabled", PageEvictionMode::kDisabled},
        {"kRandomLRU", PageEvictionMode::kRandomLRU},
        {"kRandom2LRU", PageEvictionMode::kRandom2LRU}};

std::unordered_map<std::string, InfoLogLevel>
    OptionsHelper::info_log_level_string_map = {
        {"DEBUG_LEVEL", InfoLogLevel::DEBUG_LEVEL},
        {"INFO_LEVEL", InfoLogLevel::INFO_LEVEL},
        {"WARN_LEVEL", InfoLogLevel::WARN_LEVEL},
        {"ERROR_LEVEL", InfoLogLevel::ERROR_LEVEL},
        {"FATAL_LEVEL", InfoLogLevel::FATAL_LEVEL},
        {"HEADER_LEVEL", InfoLogLevel::HEADER_LEVEL}};

const std::unordered_map<std::string, OptionTypeInfo>
    OptionsHelper::region_options_type_info = {
        {"name",
         {offsetof(struct RegionOptions, name), OptionType::kString}},
        {"initial_size",
         {offsetof(struct RegionOptions, initial_size), OptionType::kUInt64T}},
        {"max_size",
         {offsetof(struct RegionOptions, max_size), OptionType::kUInt64T}},
        {"page_eviction_mode",
         {offsetof(struct RegionOptions, page_eviction_mode),
          OptionType::kPageEvictionMode}},
        {"eviction_threshold",
         {offsetof(struct RegionOptions, eviction_threshold),
          OptionType::kDouble}},
        {"empty_pages_pool_size",
         {offsetof(struct RegionOptions, empty_pages_pool_size),
          OptionType::kInt}},
        {"swap_file_path",
         {offsetof(struct RegionOptions, swap_file_path), OptionType::kString}},
        {"metrics_enabled",
         {offsetof(struct RegionOptions, metrics_enabled),
          OptionType::kBoolean}},
        {"rate_time_interval_ms",
         {offsetof(struct RegionOptions, rate_time_interval_ms),
          OptionType::kInt64T}},
        {"sub_intervals",
         {offsetof(struct RegionOptions, sub_intervals), OptionType::kInt}},
};

const std::unordered_map<std::string, OptionTypeInfo>
    OptionsHelper::memory_options_type_info = {
        {"page_size",
         {offsetof(struct MemoryOptions, page_size), OptionType::kUInt32T}},
        {"regions",
         {offsetof(struct MemoryOptions, regions),
          OptionType::kRegionOptionsVector}},
        {"default_region_name",
         {offsetof(struct MemoryOptions, default_region_name),
          OptionType::kString}},
        {"default_region_size",
         {offsetof(struct MemoryOptions, default_region_size),
          OptionType::kUInt64T}},
        {"system_region_initial_size",
         {offsetof(struct MemoryOptions, system_region_initial_size),
          OptionType::kUInt64T}},
        {"system_region_max_size",
         {offsetof(struct MemoryOptions, system_region_max_size),
          OptionType::kUInt64T}},
        {"system_region_name",
         {offsetof(struct MemoryOptions, system_region_name),
          OptionType::kString}},
        {"override_fair_fifo_eviction",
         {offsetof(struct MemoryOptions, override_fair_fifo_eviction),
          OptionType::kBoolean}},
        {"persistence_enabled",
         {offsetof(struct MemoryOptions, persistence_enabled),
          OptionType::kBoolean}},
        {"work_dir",
         {offsetof(struct MemoryOptions, work_dir), OptionType::kString}},
        {"consistent_id",
         {offsetof(struct MemoryOptions, consistent_id), OptionType::kString}},
        {"info_log_level",
         {offsetof(struct MemoryOptions, info_log_level),
          OptionType::kInfoLogLevel}},
};

Status StringToMap(const std::string& opts_str,
                   std::unordered_map<std::string, std::string>* opts_map) {
  assert(opts_map);
  // Example:
  //   opts_str = "page_size=8K;default_region_size=1G;"
  //              "regions={{name=a;max_size=64M}:{name=b}}"
  size_t pos = 0;
  std::string opts = trim(opts_str);
  // If the input string starts and ends with "{...}", strip off the brackets
  while (opts.size() > 2 && opts[0] == '{' && opts[opts.size() - 1] == '}') {
    opts = trim(opts.substr(1, opts.size() - 2));
  }

  while (pos < opts.size()) {
    size_t eq_pos = opts.find_first_of("={};", pos);
    if (eq_pos == std::string::npos) {
      return Status::InvalidArgument("Mismatched key value pair, '=' expected");
    } else if (opts[eq_pos] != '=') {
      return Status::InvalidArgument("Unexpected char in key");
    }

    std::string key = trim(opts.substr(pos, eq_pos - pos));
    if (key.empty()) {
      return Status::InvalidArgument("Empty key found");
    }

    std::string value;
    Status s = OptionTypeInfo::NextToken(opts, ';', eq_pos + 1, &pos, &value);
    if (!s.ok()) {
      return s;
    } else {
      (*opts_map)[key] = value;
      if (pos == std::string::npos) {
        break;
      } else {
        pos++;
      }
    }
  }

  return Status::OK();
}

Status ParseRegionOptionsList(const RegionOptions& base,
                              const std::string& value,
                              std::vector<RegionOptions>* regions) {
  std::vector<RegionOptions> result;
  size_t start = 0;
  while (start < value.size()) {
    size_t end = 0;
    std::string token;
    Status s = OptionTypeInfo::NextToken(value, ':', start, &end, &token);
    if (!s.ok()) {
      return s;
    }
    if (!token.empty()) {
      RegionOptions region;
      s = GetRegionOptionsFromString(base, token, &region);
      if (!s.ok()) {
        return s;
      }
      result.push_back(std::move(region));
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  *regions = std::move(result);
  return Status::OK();
}

Status OptionTypeInfo::NextToken(const std::string& opts, char delimiter,
                                 size_t pos, size_t* end, std::string* token) {
  while (pos < opts.size() && isspace(opts[pos])) {
    ++pos;
  }
  // Empty value at the end
  if (pos >= opts.size()) {
    *token = "";
    *end = std::string::npos;
    return Status::OK();
  } else if (opts[pos] == '{') {
    int count = 1;
    size_t brace_pos = pos + 1;
    while (brace_pos < opts.size()) {
      if (opts[brace_pos] == '{') {
        ++count;
      } else if (opts[brace_pos] == '}') {
        --count;
        if (count == 0) {
          break;
        }
      }
      ++brace_pos;
    }
    // found the matching closing brace
    if (count == 0) {
      *token = trim(opts.substr(pos + 1, brace_pos - pos - 1));
      // skip all whitespace and move to the next delimiter
      // brace_pos points to the next position after the matching '}'
      pos = brace_pos + 1;
      while (pos < opts.size() && isspace(opts[pos])) {
        ++pos;
      }
      if (pos < opts.size() && opts[pos] != delimiter) {
        return Status::InvalidArgument("Unexpected chars after nested options");
      }
      *end = pos < opts.size() ? pos : std::string::npos;
    } else {
      return Status::InvalidArgument(
          "Mismatched curly braces for nested options");
    }
  } else {
    *end = opts.find(delimiter, pos);
    if (*end == std::string::npos) {
      // It either ends with a trailing semi-colon or the last key-value pair
      *token = trim(opts.substr(pos));
    } else {
      *token = trim(opts.substr(pos, *end - pos));
    }
  }
  return Status::OK();
}

static bool ParseOptionHelper(void* opt_address, const OptionType& opt_type,
                              const std::string& value) {
  switch (opt_type) {
    case OptionType::kBoolean:
      *static_cast<bool*>(opt_address) = ParseBoolean("", value);
      break;
    case OptionType::kInt:
      *static_cast<int*>(opt_address) = ParseInt(value);
      break;
    case OptionType::kInt64T:
      *static_cast<int64_t*>(opt_address) = std::stoll(value);
      break;
    case OptionType::kUInt32T:
      *static_cast<uint32_t*>(opt_address) = ParseUint32(value);
      break;
    case OptionType::kUInt64T:
      *static_cast<uint64_t*>(opt_address) = ParseUint64(value);
      break;
    case OptionType::kString:
      *static_cast<std::string*>(opt_address) = value;
      break;
    case OptionType::kDouble:
      *static_cast<double*>(opt_address) = ParseDouble(value);
      break;
    case OptionType::kPageEvictionMode:
      return ParseEnum<PageEvictionMode>(
          page_eviction_mode_string_map, value,
          static_cast<PageEvictionMode*>(opt_address));
    case OptionType::kInfoLogLevel:
      return ParseEnum<InfoLogLevel>(info_log_level_string_map, value,
                                     static_cast<InfoLogLevel*>(opt_address));
    default:
      return false;
  }
  return true;
}

Status OptionTypeInfo::Parse(const std::string& opt_name,
                             const std::string& value, void* opt_ptr) const {
  void* opt_addr = static_cast<char*>(opt_ptr) + offset_;
  if (type_ == OptionType::kRegionOptionsVector) {
    return ParseRegionOptionsList(RegionOptions(), value,
                                  static_cast<std::vector<RegionOptions>*>(
                                      opt_addr));
  }
  try {
    if (ParseOptionHelper(opt_addr, type_, value)) {
      return Status::OK();
    }
  } catch (std::exception& e) {
    return Status::InvalidArgument("Error parsing " + opt_name + ":" +
                                   std::string(e.what()));
  }
  return Status::InvalidArgument("Error parsing:", opt_name);
}

namespace {

template <typename T>
Status ParseOptionsFromMap(
    const std::unordered_map<std::string, OptionTypeInfo>& type_info,
    const T& base_options,
    const std::unordered_map<std::string, std::string>& opts_map,
    T* new_options) {
  assert(new_options);
  T copy = base_options;
  for (const auto& o : opts_map) {
    auto iter = type_info.find(o.first);
    if (iter == type_info.end()) {
      return Status::InvalidArgument("Unrecognized option", o.first);
    }
    Status s = iter->second.Parse(o.first, o.second, &copy);
    if (!s.ok()) {
      return s;
    }
  }
  *new_options = std::move(copy);
  return Status::OK();
}

}  // namespace

Status GetRegionOptionsFromMap(
    const RegionOptions& base_options,
    const std::unordered_map<std::string, std::string>& opts_map,
    RegionOptions* new_options) {
  return ParseOptionsFromMap(OptionsHelper::region_options_type_info,
                             base_options, opts_map, new_options);
}

Status GetMemoryOptionsFromMap(
    const MemoryOptions& base_options,
    const std::unordered_map<std::string, std::string>& opts_map,
    MemoryOptions* new_options) {
  return ParseOptionsFromMap(OptionsHelper::memory_options_type_info,
                             base_options, opts_map, new_options);
}

Status GetRegionOptionsFromString(const RegionOptions& base_options,
                                  const std::string& opts_str,
                                  RegionOptions* new_options) {
  std::unordered_map<std::string, std::string> opts_map;
  Status s = StringToMap(opts_str, &opts_map);
  if (!s.ok()) {
    return s;
  }
  return GetRegionOptionsFromMap(base_options, opts_map, new_options);
}

Status GetMemoryOptionsFromString(const MemoryOptions& base_options,
                                  const std::string& opts_str,
                                  MemoryOptions* new_options) {
  std::unordered_map<std::string, std::string> opts_map;
  Status s = StringToMap(opts_str, &opts_map);
  if (!s.ok()) {
    return s;
  }
  return GetMemoryOptionsFromMap(base_options, opts_map, new_options);
}

}  // namespace PAGEPOOL_NAMESPACE
