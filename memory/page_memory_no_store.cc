//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "memory/page_memory_no_store.h"

#include <string.h>

#include <algorithm>
#include <cinttypes>

#include "logging/logging.h"
#include "monitoring/region_metrics_impl.h"
#include "util/mutexlock.h"
#include "util/string_util.h"

namespace PAGEPOOL_NAMESPACE {

namespace {
const uint64_t kAllocatedMarker = 0x50414745414c4cull;  // "PAGEALL"

inline uint64_t DecodeFixed64(const char* ptr) {
  uint64_t v;
  memcpy(&v, ptr, sizeof(v));
  return v;
}

inline void EncodeFixed64(char* ptr, uint64_t v) {
  memcpy(ptr, &v, sizeof(v));
}
}  // namespace

PageMemoryNoStore::PageMemoryNoStore(
    const RegionOptions& options, uint32_t page_size,
    std::unique_ptr<DirectMemoryProvider> provider, RegionMetricsImpl* metrics,
    std::shared_ptr<Logger> info_log)
    : name_(options.name),
      initial_size_(options.initial_size),
      max_size_(options.max_size),
      page_size_(page_size),
      sys_page_size_(page_size + kPageHeaderSize),
      provider_(std::move(provider)),
      metrics_(metrics),
      info_log_(std::move(info_log)),
      started_(false),
      next_index_(0),
      loaded_pages_(0) {}

PageMemoryNoStore::~PageMemoryNoStore() {
  if (started_) {
    Stop().PermitUncheckedError();
  }
}

std::vector<uint64_t> PageMemoryNoStore::ComputeSegmentSizes(
    uint64_t initial_size, uint64_t max_size) {
  std::vector<uint64_t> sizes;
  sizes.push_back(initial_size);
  uint64_t remaining = max_size > initial_size ? max_size - initial_size : 0;
  const uint64_t segment_size = std::max<uint64_t>(
      remaining / (kSegmentCount - 1), kMinSegmentSize);
  while (remaining > 0 && sizes.size() < kSegmentCount) {
    uint64_t size = std::min(segment_size, remaining);
    sizes.push_back(size);
    remaining -= size;
  }
  return sizes;
}

Status PageMemoryNoStore::Start() {
  MutexLock l(&mu_);
  if (started_) {
    return Status::OK();
  }
  Status s =
      provider_->Initialize(ComputeSegmentSizes(initial_size_, max_size_));
  if (s.ok()) {
    s = MapNextSegment();
  }
  if (!s.ok()) {
    provider_->Shutdown().PermitUncheckedError();
    segments_.clear();
    return s;
  }
  started_ = true;
  PAGEPOOL_LOG_INFO(info_log_,
                    "Started page memory of region %s [initial=%s, max=%s, "
                    "system_page_size=%" PRIu32 ", provider=%s]",
                    name_.c_str(), BytesToHumanString(initial_size_).c_str(),
                    BytesToHumanString(max_size_).c_str(), sys_page_size_,
                    provider_->Name());
  return Status::OK();
}

Status PageMemoryNoStore::Stop() {
  MutexLock l(&mu_);
  if (!started_) {
    return Status::OK();
  }
  started_ = false;
  segments_.clear();
  recycled_.clear();
  next_index_ = 0;
  loaded_pages_.store(0, std::memory_order_relaxed);
  Status s = provider_->Shutdown();
  PAGEPOOL_LOG_INFO(info_log_, "Stopped page memory of region %s",
                    name_.c_str());
  return s;
}

Status PageMemoryNoStore::MapNextSegment() {
  mu_.AssertHeld();
  DirectMemoryRegion region;
  Status s = provider_->NextRegion(&region);
  if (!s.ok()) {
    return s;
  }
  Segment segment;
  segment.base = region.address;
  segment.pages = static_cast<uint32_t>(region.size / sys_page_size_);
  segments_.push_back(segment);
  next_index_ = 0;
  return Status::OK();
}

Status PageMemoryNoStore::AllocatePage(PageId* page_id) {
  PageId id = 0;
  {
    MutexLock l(&mu_);
    if (!started_) {
      return Status::ShutdownInProgress("Page memory is not started", name_);
    }
    if (!recycled_.empty()) {
      id = recycled_.back();
      recycled_.pop_back();
    } else {
      while (segments_.empty() || next_index_ >= segments_.back().pages) {
        Status s = MapNextSegment();
        if (s.IsIncomplete()) {
          return Status::Aborted(
              "Out of memory in region",
              "name=" + name_ + ", initial_size=" +
                  BytesToHumanString(initial_size_) +
                  ", max_size=" + BytesToHumanString(max_size_) +
                  ", loaded_pages=" + std::to_string(LoadedPages()));
        } else if (!s.ok()) {
          return s;
        }
      }
      id = MakePageId(static_cast<uint32_t>(segments_.size() - 1),
                      next_index_++);
    }
    char* header = PageHeader(id);
    EncodeFixed64(header, id);
    EncodeFixed64(header + 8, kAllocatedMarker);
    loaded_pages_.fetch_add(1, std::memory_order_relaxed);
  }
  if (metrics_ != nullptr) {
    metrics_->UpdateTotalAllocatedPages(1);
  }
  *page_id = id;
  return Status::OK();
}

Status PageMemoryNoStore::FreePage(PageId page_id) {
  {
    MutexLock l(&mu_);
    char* header = PageHeader(page_id);
    if (header == nullptr || DecodeFixed64(header + 8) != kAllocatedMarker) {
      return Status::InvalidArgument("Page is not allocated",
                                     std::to_string(page_id));
    }
    EncodeFixed64(header + 8, 0);
    recycled_.push_back(page_id);
    loaded_pages_.fetch_sub(1, std::memory_order_relaxed);
  }
  if (metrics_ != nullptr) {
    metrics_->UpdateTotalAllocatedPages(-1);
  }
  return Status::OK();
}

char* PageMemoryNoStore::PageAddress(PageId page_id) const {
  MutexLock l(&mu_);
  char* header = PageHeader(page_id);
  if (header == nullptr || DecodeFixed64(header + 8) != kAllocatedMarker) {
    return nullptr;
  }
  return header + kPageHeaderSize;
}

char* PageMemoryNoStore::PageHeader(PageId page_id) const {
  mu_.AssertHeld();
  uint32_t segment = PageSegment(page_id);
  uint32_t index = PageIndex(page_id);
  if (segment >= segments_.size()) {
    return nullptr;
  }
  // Pages past next_index_ of the last segment were never handed out.
  if (index >= segments_[segment].pages ||
      (segment + 1 == segments_.size() && index >= next_index_)) {
    return nullptr;
  }
  return segments_[segment].base +
         static_cast<uint64_t>(index) * sys_page_size_;
}

}  // namespace PAGEPOOL_NAMESPACE
