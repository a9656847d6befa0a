//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "memory/direct_memory_provider.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <cinttypes>

#include "logging/logging.h"
#include "util/string_util.h"

namespace PAGEPOOL_NAMESPACE {

namespace {
const char* kAllocatorFilePrefix = "allocator-";
const char* kAllocatorFileSuffix = ".bin";
}  // namespace

Status AnonymousMemoryProvider::Initialize(
    const std::vector<uint64_t>& chunk_sizes) {
  chunk_sizes_ = chunk_sizes;
  mappings_.clear();
  return Status::OK();
}

Status AnonymousMemoryProvider::NextRegion(DirectMemoryRegion* region) {
  size_t idx = mappings_.size();
  if (idx >= chunk_sizes_.size()) {
    return Status::Incomplete("All memory chunks are mapped");
  }
  MemMapping mm = MemMapping::AllocateLazyZeroed(chunk_sizes_[idx]);
  if (mm.Get() == nullptr) {
    return Status::Aborted("Failed to map anonymous memory",
                           BytesToHumanString(chunk_sizes_[idx]));
  }
  region->address = static_cast<char*>(mm.Get());
  region->size = mm.Length();
  mappings_.push_back(std::move(mm));
  return Status::OK();
}

Status AnonymousMemoryProvider::Shutdown() {
  mappings_.clear();
  return Status::OK();
}

MappedFileMemoryProvider::~MappedFileMemoryProvider() {
  if (!files_.empty()) {
    Shutdown().PermitUncheckedError();
  }
}

std::string MappedFileMemoryProvider::AllocatorFileName(const std::string& dir,
                                                        size_t idx) {
  return dir + "/" + kAllocatorFilePrefix + std::to_string(idx) +
         kAllocatorFileSuffix;
}

Status MappedFileMemoryProvider::Initialize(
    const std::vector<uint64_t>& chunk_sizes) {
  Status s = env_->CreateDirRecursively(dir_);
  if (!s.ok()) {
    return s;
  }

  std::vector<std::string> children;
  s = env_->GetChildren(dir_, &children);
  if (!s.ok()) {
    return s;
  }
  for (const auto& child : children) {
    if (StartsWith(child, kAllocatorFilePrefix) &&
        EndsWith(child, kAllocatorFileSuffix)) {
      s = env_->DeleteFile(dir_ + "/" + child);
      if (!s.ok()) {
        return s;
      }
      PAGEPOOL_LOG_INFO(info_log_, "Deleted stale allocator file %s/%s",
                        dir_.c_str(), child.c_str());
    }
  }

  chunk_sizes_ = chunk_sizes;
  mappings_.clear();
  files_.clear();
  return Status::OK();
}

Status MappedFileMemoryProvider::NextRegion(DirectMemoryRegion* region) {
  size_t idx = mappings_.size();
  if (idx >= chunk_sizes_.size()) {
    return Status::Incomplete("All memory chunks are mapped");
  }
  const std::string fname = AllocatorFileName(dir_, idx);
  const uint64_t size = chunk_sizes_[idx];

  int fd = open(fname.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (fd < 0) {
    return Status::IOError("While open a file for memory mapping " + fname,
                           strerror(errno));
  }
  if (ftruncate(fd, static_cast<off_t>(size)) != 0) {
    int err = errno;
    close(fd);
    env_->DeleteFile(fname).PermitUncheckedError();
    return Status::IOError("While ftruncate " + fname, strerror(err));
  }
  MemMapping mm = MemMapping::MapFile(fd, size);
  int map_err = errno;
  close(fd);
  if (mm.Get() == nullptr) {
    env_->DeleteFile(fname).PermitUncheckedError();
    return Status::IOError("While mmap " + fname, strerror(map_err));
  }

  region->address = static_cast<char*>(mm.Get());
  region->size = mm.Length();
  mappings_.push_back(std::move(mm));
  files_.push_back(fname);
  return Status::OK();
}

Status MappedFileMemoryProvider::Shutdown() {
  mappings_.clear();
  Status result;
  for (const auto& fname : files_) {
    Status s = env_->DeleteFile(fname);
    if (!s.ok()) {
      PAGEPOOL_LOG_ERROR(info_log_, "Failed to delete allocator file %s: %s",
                         fname.c_str(), s.ToString().c_str());
      if (result.ok()) {
        result = s;
      }
    }
  }
  files_.clear();
  return result;
}

}  // namespace PAGEPOOL_NAMESPACE
