//  Copyright (c) Meta Platforms, Inc. and affiliates.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "port/mmap.h"

#include <cassert>
#include <cstdio>
#include <cstring>
#include <new>
#include <utility>

namespace PAGEPOOL_NAMESPACE {

MemMapping::~MemMapping() {
  if (addr_ != nullptr) {
    auto status = munmap(addr_, length_);
    assert(status == 0);
    (void)status;
  }
}

MemMapping::MemMapping(MemMapping&& other) noexcept {
  *this = std::move(other);
}

MemMapping& MemMapping::operator=(MemMapping&& other) noexcept {
  if (&other == this) {
    return *this;
  }
  this->~MemMapping();
  std::memcpy(this, &other, sizeof(*this));
  new (&other) MemMapping();
  return *this;
}

MemMapping MemMapping::AllocateLazyZeroed(size_t length) {
  MemMapping mm;
  mm.length_ = length;
  assert(mm.addr_ == nullptr);
  if (length == 0) {
    // OK to leave addr as nullptr
    return mm;
  }
  mm.addr_ = mmap(nullptr, length, PROT_READ | PROT_WRITE,
                  MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
  if (mm.addr_ == MAP_FAILED) {
    mm.addr_ = nullptr;
  }
  return mm;
}

MemMapping MemMapping::MapFile(int fd, size_t length) {
  MemMapping mm;
  mm.length_ = length;
  if (length == 0 || fd < 0) {
    return mm;
  }
  mm.addr_ = mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
  if (mm.addr_ == MAP_FAILED) {
    mm.addr_ = nullptr;
  }
  return mm;
}

}  // namespace PAGEPOOL_NAMESPACE
