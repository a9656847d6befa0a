//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).
//
// Must not be included from any .h files to avoid polluting the namespace
// with macros.

#pragma once

#include "pagepool/env.h"

// Helper macros that include information about file name and line number
#define PAGEPOOL_LOG_STRINGIFY(x) #x
#define PAGEPOOL_LOG_TOSTRING(x) PAGEPOOL_LOG_STRINGIFY(x)
#define PAGEPOOL_LOG_PREPEND_FILE_LINE(FMT) \
  ("[%s:" PAGEPOOL_LOG_TOSTRING(__LINE__) "] " FMT)

inline const char* PagePoolLogShorterFileName(const char* file) {
  // 18 is the size of "logging/logging.h" including the terminating null.
  // If the name of this file changed, please change this number, too.
  return file + (sizeof(__FILE__) > 18 ? sizeof(__FILE__) - 18 : 0);
}

// Don't include file/line info in HEADER level
#define PAGEPOOL_LOG_HEADER(LGR, FMT, ...) \
  PAGEPOOL_NAMESPACE::Log(InfoLogLevel::HEADER_LEVEL, LGR, FMT, ##__VA_ARGS__)

#define PAGEPOOL_LOG_AT_LEVEL(LGR, LVL, FMT, ...)                           \
  PAGEPOOL_NAMESPACE::Log((LVL), (LGR), PAGEPOOL_LOG_PREPEND_FILE_LINE(FMT), \
                          PagePoolLogShorterFileName(__FILE__), ##__VA_ARGS__)

#define PAGEPOOL_LOG_DEBUG(LGR, FMT, ...) \
  PAGEPOOL_LOG_AT_LEVEL((LGR), InfoLogLevel::DEBUG_LEVEL, FMT, ##__VA_ARGS__)

#define PAGEPOOL_LOG_INFO(LGR, FMT, ...) \
  PAGEPOOL_LOG_AT_LEVEL((LGR), InfoLogLevel::INFO_LEVEL, FMT, ##__VA_ARGS__)

#define PAGEPOOL_LOG_WARN(LGR, FMT, ...) \
  PAGEPOOL_LOG_AT_LEVEL((LGR), InfoLogLevel::WARN_LEVEL, FMT, ##__VA_ARGS__)

#define PAGEPOOL_LOG_ERROR(LGR, FMT, ...) \
  PAGEPOOL_LOG_AT_LEVEL((LGR), InfoLogLevel::ERROR_LEVEL, FMT, ##__VA_ARGS__)

#define PAGEPOOL_LOG_FATAL(LGR, FMT, ...) \
  PAGEPOOL_LOG_AT_LEVEL((LGR), InfoLogLevel::FATAL_LEVEL, FMT, ##__VA_ARGS__)
