//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).
//
// Platform primitives for POSIX hosts.

#pragma once

#include <pthread.h>
#include <stdint.h>
#include <string.h>

#include <limits>
#include <string>

#include "pagepool/pagepool_namespace.h"

// size_t printf formatting named in the manner of C99 standard formatting
// strings such as PRIu64
// in fact, we could use that one
#define PAGEPOOL_PRIszt "zu"

namespace PAGEPOOL_NAMESPACE {

namespace port {

// Width of a pointer on the build target. Region sizing rules that only
// apply to 32-bit address spaces key off this value.
constexpr int kAddressSpaceBits = static_cast<int>(sizeof(void*) * 8);

class CondVar;

class Mutex {
 public:
  Mutex();
  // No copying
  Mutex(const Mutex&) = delete;
  void operator=(const Mutex&) = delete;

  ~Mutex();

  void Lock();
  void Unlock();

  // this will assert if the mutex is not locked
  // it does NOT verify that mutex is held by a calling thread
  void AssertHeld() const;

  // Also implement std Lockable
  inline void lock() { Lock(); }
  inline void unlock() { Unlock(); }

 private:
  friend class CondVar;
  pthread_mutex_t mu_;
#ifndef NDEBUG
  bool locked_ = false;
#endif
};

class CondVar {
 public:
  explicit CondVar(Mutex* mu);
  ~CondVar();
  void Wait();
  void SignalAll();

 private:
  pthread_cond_t cv_;
  Mutex* mu_;
};

// Size of an OS memory page, as reported by sysconf.
// Bytes of physical memory installed, or 0 if the platform cannot tell.
extern uint64_t GetPhysicalMemorySize();

}  // namespace port
}  // namespace PAGEPOOL_NAMESPACE
