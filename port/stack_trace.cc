//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).
//
#include "port/stack_trace.h"

#if !defined(__linux__) || !defined(__GLIBC__)

// noop

namespace PAGEPOOL_NAMESPACE {
namespace port {
void InstallStackTraceHandler() {}
void PrintStack(int /*first_frames_to_skip*/) {}
}  // namespace port
}  // namespace PAGEPOOL_NAMESPACE

#else

#include <cxxabi.h>
#include <execinfo.h>
#include <unistd.h>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace PAGEPOOL_NAMESPACE {
namespace port {

namespace {

void PrintStackTraceLine(const char* symbol) {
  // Symbols look like "binary(mangled+offset) [address]".
  const char* open = strchr(symbol, '(');
  const char* plus = open ? strchr(open, '+') : nullptr;
  if (open == nullptr || plus == nullptr || plus == open + 1) {
    fprintf(stderr, "%s\n", symbol);
    return;
  }
  std::string mangled(open + 1, plus - open - 1);
  int status = 0;
  char* demangled =
      abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
  if (status == 0 && demangled != nullptr) {
    fprintf(stderr, "%.*s%s%s\n", static_cast<int>(open - symbol + 1), symbol,
            demangled, plus);
  } else {
    fprintf(stderr, "%s\n", symbol);
  }
  free(demangled);
}

void StackTraceHandler(int sig) {
  // reset to default handler
  signal(sig, SIG_DFL);
  fprintf(stderr, "Received signal %d (%s)\n", sig, strsignal(sig));
  // skip the top two signal handler related frames
  PrintStack(2);
  // re-signal to default handler (so we still get core dump if needed...)
  raise(sig);
}

}  // namespace

void PrintStack(int first_frames_to_skip) {
  const int kMaxFrames = 100;
  void* frames[kMaxFrames];

  auto num_frames = backtrace(frames, kMaxFrames);
  char** symbols = backtrace_symbols(frames, num_frames);
  if (symbols == nullptr) {
    return;
  }
  for (int i = first_frames_to_skip; i < num_frames; ++i) {
    fprintf(stderr, "#%-2d  ", i - first_frames_to_skip);
    PrintStackTraceLine(symbols[i]);
  }
  free(symbols);
}

void InstallStackTraceHandler() {
  // just use the plain old signal as it's simple and sufficient
  // for this use case
  signal(SIGILL, StackTraceHandler);
  signal(SIGSEGV, StackTraceHandler);
  signal(SIGBUS, StackTraceHandler);
  signal(SIGABRT, StackTraceHandler);
}

}  // namespace port
}  // namespace PAGEPOOL_NAMESPACE

#endif
