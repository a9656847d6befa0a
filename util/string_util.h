//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pagepool/pagepool_namespace.h"

namespace PAGEPOOL_NAMESPACE {

extern std::vector<std::string> StringSplit(const std::string& arg, char delim);

// Return a human-readable version of bytes
// ex: 1048576 -> 1.00 MB
extern std::string BytesToHumanString(uint64_t bytes);

// Return a human-readable version of the double with two decimals.
extern std::string ToStringWithPrecision(double value);

// Removes leading and trailing whitespace.
extern std::string trim(const std::string& str);

// Returns true if "string" starts with "pattern"
extern bool StartsWith(const std::string& string, const std::string& pattern);

// Returns true if "string" ends with "pattern"
extern bool EndsWith(const std::string& string, const std::string& pattern);

// The Parse* family throws std::invalid_argument or std::out_of_range on
// malformed input. Callers at an API boundary convert to Status.
bool ParseBoolean(const std::string& type, const std::string& value);

// Accepts an optional K/M/G/T suffix (case-insensitive, powers of 1024).
uint64_t ParseUint64(const std::string& value);

uint32_t ParseUint32(const std::string& value);

int ParseInt(const std::string& value);

double ParseDouble(const std::string& value);

// Replaces every character of "from" in "input" with "to".
extern std::string ReplaceChars(const std::string& input,
                                const std::string& from, char to);

}  // namespace PAGEPOOL_NAMESPACE
