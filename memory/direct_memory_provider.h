//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "pagepool/env.h"
#include "pagepool/status.h"
#include "port/mmap.h"

namespace PAGEPOOL_NAMESPACE {

// A contiguous chunk of raw memory handed out by a DirectMemoryProvider.
struct DirectMemoryRegion {
  char* address = nullptr;
  uint64_t size = 0;
};

// Source of the raw memory behind a PageMemory. The memory is requested as
// a fixed sequence of chunks: Initialize() announces their sizes and
// NextRegion() maps them one by one.
class DirectMemoryProvider {
 public:
  virtual ~DirectMemoryProvider() {}

  virtual const char* Name() const = 0;

  virtual Status Initialize(const std::vector<uint64_t>& chunk_sizes) = 0;

  // Maps the next chunk. Returns Incomplete once every chunk is mapped.
  virtual Status NextRegion(DirectMemoryRegion* region) = 0;

  // Releases every chunk.
  virtual Status Shutdown() = 0;
};

// Anonymous process memory, zeroed lazily by the OS.
class AnonymousMemoryProvider : public DirectMemoryProvider {
 public:
  const char* Name() const override { return "AnonymousMemoryProvider"; }

  Status Initialize(const std::vector<uint64_t>& chunk_sizes) override;
  Status NextRegion(DirectMemoryRegion* region) override;
  Status Shutdown() override;

 private:
  std::vector<uint64_t> chunk_sizes_;
  std::vector<MemMapping> mappings_;
};

// Memory-mapped files "allocator-<n>.bin" in a swap directory. Allocator
// files left over from an earlier run are deleted by Initialize(); files
// are unmapped and deleted by Shutdown().
class MappedFileMemoryProvider : public DirectMemoryProvider {
 public:
  MappedFileMemoryProvider(Env* env, std::string dir,
                           std::shared_ptr<Logger> info_log)
      : env_(env), dir_(std::move(dir)), info_log_(std::move(info_log)) {}

  ~MappedFileMemoryProvider() override;

  const char* Name() const override { return "MappedFileMemoryProvider"; }

  Status Initialize(const std::vector<uint64_t>& chunk_sizes) override;
  Status NextRegion(DirectMemoryRegion* region) override;
  Status Shutdown() override;

  static std::string AllocatorFileName(const std::string& dir, size_t idx);

 private:
  Env* env_;
  const std::string dir_;
  std::shared_ptr<Logger> info_log_;
  std::vector<uint64_t> chunk_sizes_;
  std::vector<MemMapping> mappings_;
  std::vector<std::string> files_;
};

}  // namespace PAGEPOOL_NAMESPACE
