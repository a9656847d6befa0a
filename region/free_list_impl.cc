//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "region/free_list_impl.h"

#include <cinttypes>

#include "logging/logging.h"
#include "util/mutexlock.h"
#include "util/string_util.h"

namespace PAGEPOOL_NAMESPACE {

FreeListImpl::FreeListImpl(std::string region_name, PageMemory* page_memory)
    : region_name_(std::move(region_name)),
      page_memory_(page_memory),
      capacity_(page_memory->PageSize()),
      buckets_(kBucketCount),
      used_bytes_(0) {}

int FreeListImpl::BucketFor(uint32_t free_bytes) const {
  if (free_bytes == 0) {
    return -1;
  }
  return static_cast<int>(static_cast<uint64_t>(free_bytes) * kBucketCount /
                          (static_cast<uint64_t>(capacity_) + 1));
}

void FreeListImpl::Unbucket(PageId page_id, const PageInfo& info) {
  mu_.AssertHeld();
  int b = BucketFor(capacity_ - info.used_bytes);
  if (b >= 0) {
    buckets_[b].erase(page_id);
  }
}

void FreeListImpl::Bucket(PageId page_id, const PageInfo& info) {
  mu_.AssertHeld();
  int b = BucketFor(capacity_ - info.used_bytes);
  if (b >= 0) {
    buckets_[b].insert(page_id);
  }
}

bool FreeListImpl::FindPageWithRoom(uint32_t row_size,
                                    PageId* page_id) const {
  mu_.AssertHeld();
  // Pages in a bucket above the one of `row_size` always have room; the
  // bucket of `row_size` itself has to be checked page by page.
  const int first = BucketFor(row_size);
  for (PageId id : buckets_[first]) {
    auto it = pages_.find(id);
    if (capacity_ - it->second.used_bytes >= row_size) {
      *page_id = id;
      return true;
    }
  }
  for (size_t b = static_cast<size_t>(first) + 1; b < kBucketCount; ++b) {
    if (!buckets_[b].empty()) {
      *page_id = *buckets_[b].begin();
      return true;
    }
  }
  return false;
}

void FreeListImpl::PushEmptyPage(PageId page_id) {
  mu_.AssertHeld();
  empty_pages_.push_back(page_id);
  empty_page_set_.insert(page_id);
}

PageId FreeListImpl::PopEmptyPage() {
  mu_.AssertHeld();
  PageId page_id = empty_pages_.back();
  empty_pages_.pop_back();
  empty_page_set_.erase(page_id);
  return page_id;
}

Status FreeListImpl::AddForRecycle(PageId page_id) {
  MutexLock l(&mu_);
  if (pages_.count(page_id) != 0) {
    return Status::InvalidArgument("Page still holds rows",
                                   std::to_string(page_id));
  }
  if (empty_page_set_.count(page_id) != 0) {
    return Status::InvalidArgument("Page is already recycled",
                                   std::to_string(page_id));
  }
  if (page_memory_->PageAddress(page_id) == nullptr) {
    return Status::InvalidArgument(
        "Page is not allocated in region",
        region_name_ + ", page=" + std::to_string(page_id));
  }
  PushEmptyPage(page_id);
  return Status::OK();
}

Status FreeListImpl::TakeRecycledPage(PageId* page_id) {
  MutexLock l(&mu_);
  if (empty_pages_.empty()) {
    return Status::NotFound("No recycled pages in region", region_name_);
  }
  *page_id = PopEmptyPage();
  return Status::OK();
}

uint64_t FreeListImpl::RecycledPagesCount() const {
  MutexLock l(&mu_);
  return empty_pages_.size();
}

uint64_t FreeListImpl::EmptyDataPages() const {
  MutexLock l(&mu_);
  return empty_pages_.size();
}

uint64_t FreeListImpl::DataPagesCount() const {
  MutexLock l(&mu_);
  return pages_.size();
}

void FreeListImpl::GetFillFactor(uint64_t* used, uint64_t* total) const {
  MutexLock l(&mu_);
  *used = used_bytes_;
  *total = static_cast<uint64_t>(pages_.size()) * capacity_;
}

Status FreeListImpl::InsertDataRow(uint32_t row_size, PageId* page_id) {
  if (row_size == 0) {
    return Status::InvalidArgument("Row size must be positive");
  }
  if (row_size > capacity_) {
    return Status::NotSupported(
        "Row does not fit in a data page",
        "row_size=" + std::to_string(row_size) +
            ", page_capacity=" + std::to_string(capacity_));
  }

  MutexLock l(&mu_);
  PageId id = 0;
  if (FindPageWithRoom(row_size, &id)) {
    PageInfo& info = pages_[id];
    Unbucket(id, info);
    info.used_bytes += row_size;
    info.rows++;
    Bucket(id, info);
  } else {
    if (!empty_pages_.empty()) {
      id = PopEmptyPage();
    } else {
      Status s = page_memory_->AllocatePage(&id);
      if (!s.ok()) {
        return s;
      }
    }
    PageInfo& info = pages_[id];
    info.used_bytes = row_size;
    info.rows = 1;
    Bucket(id, info);
  }
  used_bytes_ += row_size;
  *page_id = id;
  return Status::OK();
}

Status FreeListImpl::RemoveDataRow(PageId page_id, uint32_t row_size,
                                   bool* page_emptied) {
  MutexLock l(&mu_);
  auto it = pages_.find(page_id);
  if (it == pages_.end()) {
    return Status::NotFound("Page holds no rows", std::to_string(page_id));
  }
  PageInfo& info = it->second;
  if (row_size > info.used_bytes || info.rows == 0) {
    return Status::InvalidArgument(
        "Row is larger than the data on the page",
        "page=" + std::to_string(page_id) +
            ", row_size=" + std::to_string(row_size) +
            ", used_bytes=" + std::to_string(info.used_bytes));
  }
  Unbucket(page_id, info);
  info.used_bytes -= row_size;
  info.rows--;
  used_bytes_ -= row_size;
  bool emptied = info.rows == 0;
  if (emptied) {
    // Leftover bytes belong to no row anymore.
    used_bytes_ -= info.used_bytes;
    pages_.erase(it);
    PushEmptyPage(page_id);
  } else {
    Bucket(page_id, info);
  }
  if (page_emptied != nullptr) {
    *page_emptied = emptied;
  }
  return Status::OK();
}

bool FreeListImpl::HoldsRows(PageId page_id) const {
  MutexLock l(&mu_);
  return pages_.count(page_id) != 0;
}

Status FreeListImpl::EvictDataPage(PageId page_id) {
  MutexLock l(&mu_);
  auto it = pages_.find(page_id);
  if (it == pages_.end()) {
    return Status::NotFound("Page holds no rows", std::to_string(page_id));
  }
  Unbucket(page_id, it->second);
  used_bytes_ -= it->second.used_bytes;
  pages_.erase(it);
  PushEmptyPage(page_id);
  return Status::OK();
}

void FreeListImpl::DumpStatistics(Logger* info_log) const {
  MutexLock l(&mu_);
  std::string buckets;
  for (size_t b = 0; b < kBucketCount; ++b) {
    if (b > 0) {
      buckets.append(", ");
    }
    buckets.append(std::to_string(buckets_[b].size()));
  }
  const uint64_t total = static_cast<uint64_t>(pages_.size()) * capacity_;
  PAGEPOOL_LOG_INFO(
      info_log,
      "FreeList statistics [region=%s, data_pages=%" PAGEPOOL_PRIszt
      ", empty_pages=%" PAGEPOOL_PRIszt ", used=%s, capacity=%s, buckets=[%s]]",
      region_name_.c_str(), pages_.size(), empty_pages_.size(),
      BytesToHumanString(used_bytes_).c_str(),
      BytesToHumanString(total).c_str(), buckets.c_str());
}

}  // namespace PAGEPOOL_NAMESPACE
