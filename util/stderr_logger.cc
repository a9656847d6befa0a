//  Copyright (c) Meta Platforms, Inc. and affiliates.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "util/stderr_logger.h"

#include <sys/time.h>
#include <time.h>

namespace PAGEPOOL_NAMESPACE {

StderrLogger::~StderrLogger() {}

void StderrLogger::Logv(const char* format, va_list ap) {
  struct timeval now_tv;
  gettimeofday(&now_tv, nullptr);
  const time_t seconds = now_tv.tv_sec;
  struct tm t;
  localtime_r(&seconds, &t);

  // The header and the message are written with a single fprintf-family call
  // each; lines from different threads may interleave but are never torn
  // within a call.
  fprintf(stderr, "%04d/%02d/%02d-%02d:%02d:%02d.%06d ", t.tm_year + 1900,
          t.tm_mon + 1, t.tm_mday, t.tm_hour, t.tm_min, t.tm_sec,
          static_cast<int>(now_tv.tv_usec));
  vfprintf(stderr, format, ap);
  fprintf(stderr, "\n");
}

}  // namespace PAGEPOOL_NAMESPACE
