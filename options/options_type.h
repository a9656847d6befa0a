// Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stddef.h>

#include <string>
#include <unordered_map>

#include "pagepool/pagepool_namespace.h"
#include "pagepool/status.h"

namespace PAGEPOOL_NAMESPACE {

enum class OptionType {
  kBoolean,
  kInt,
  kInt64T,
  kUInt32T,
  kUInt64T,
  kString,
  kDouble,
  kPageEvictionMode,
  kInfoLogLevel,
  kRegionOptionsVector,
  kUnknown,
};

// Converts an string into its enumerated value.
// @param type_map Mapping between strings and enum values
// @param type The string representation of the enum
// @param value Returns the enum value represented by the string
// @return true if the string was found in the enum map, false otherwise.
template <typename T>
bool ParseEnum(const std::unordered_map<std::string, T>& type_map,
               const std::string& type, T* value) {
  auto iter = type_map.find(type);
  if (iter != type_map.end()) {
    *value = iter->second;
    return true;
  }
  return false;
}

// Converts an enum into its string representation.
// @param type_map Mapping between strings and enum values
// @param type The enum
// @param value Returned as the string representation of the enum
// @return true if the enum was found in the enum map, false otherwise.
template <typename T>
bool SerializeEnum(const std::unordered_map<std::string, T>& type_map,
                   const T& type, std::string* value) {
  for (const auto& pair : type_map) {
    if (pair.second == type) {
      *value = pair.first;
      return true;
    }
  }
  return false;
}

// Describes one field of an options struct: where it lives and how its
// string form is parsed.
class OptionTypeInfo {
 public:
  OptionTypeInfo(size_t offset, OptionType type)
      : offset_(offset), type_(type) {}

  OptionType GetType() const { return type_; }

  // Parses `value` into the field of the struct at `opt_ptr`.
  // Returns InvalidArgument if the value is malformed.
  Status Parse(const std::string& opt_name, const std::string& value,
               void* opt_ptr) const;

  // Finds the next token in `opts`, starting at `pos` and ending at the
  // `delimiter` or the end of the string. A token wrapped in braces is
  // returned without the braces and may itself contain delimiters.
  // `*end` is set to the position of the delimiter, or npos.
  static Status NextToken(const std::string& opts, char delimiter, size_t pos,
                          size_t* end, std::string* token);

 private:
  size_t offset_;
  OptionType type_;
};

}  // namespace PAGEPOOL_NAMESPACE
