//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "region/region_impl.h"

#include "evict/page_eviction_tracker_impl.h"
#include "logging/logging.h"
#include "region/admission_control.h"

namespace PAGEPOOL_NAMESPACE {

RegionImpl::RegionImpl(const RegionOptions& options, uint32_t page_size,
                       bool is_default, bool persistence_enabled,
                       PageEvictionTrackerType tracker_type,
                       std::unique_ptr<DirectMemoryProvider> provider,
                       FreeListResolver* resolver, SystemClock* clock,
                       std::shared_ptr<Logger> info_log)
    : options_(options),
      is_default_(is_default),
      persistence_enabled_(persistence_enabled),
      tracker_type_(tracker_type),
      info_log_(std::move(info_log)),
      started_(false) {
  metrics_.reset(new RegionMetricsImpl(
      options_,
      std::unique_ptr<FillFactorProvider>(
          new FillFactorProvider(options_.name, resolver)),
      clock));
  page_memory_.reset(new PageMemoryNoStore(
      options_, page_size, std::move(provider), metrics_.get(), info_log_));
  free_list_.reset(new FreeListImpl(options_.name, page_memory_.get()));
  tracker_ = NewPageEvictionTracker(tracker_type_, free_list_.get(),
                                    metrics_.get(), clock);
}

RegionImpl::~RegionImpl() {
  if (started_) {
    Stop().PermitUncheckedError();
  }
}

Status RegionImpl::Start() {
  Status s = page_memory_->Start();
  if (!s.ok()) {
    PAGEPOOL_LOG_ERROR(info_log_,
                       "Failed to start page memory of region %s: %s",
                       options_.name.c_str(), s.ToString().c_str());
    return s;
  }
  s = tracker_->Start();
  if (!s.ok()) {
    PAGEPOOL_LOG_ERROR(info_log_, "Failed to start %s of region %s: %s",
                       tracker_->Name(), options_.name.c_str(),
                       s.ToString().c_str());
    page_memory_->Stop().PermitUncheckedError();
    return s;
  }
  started_ = true;
  PAGEPOOL_LOG_INFO(info_log_, "Started region %s [default=%d, tracker=%s]",
                    options_.name.c_str(), is_default_, tracker_->Name());
  return s;
}

Status RegionImpl::Stop() {
  if (!started_) {
    return Status::OK();
  }
  started_ = false;
  tracker_->Stop();
  Status s = page_memory_->Stop();
  if (!s.ok()) {
    PAGEPOOL_LOG_ERROR(info_log_,
                       "Failed to stop page memory of region %s: %s",
                       options_.name.c_str(), s.ToString().c_str());
  } else {
    PAGEPOOL_LOG_INFO(info_log_, "Stopped region %s", options_.name.c_str());
  }
  return s;
}

Status RegionImpl::EnsureFreeSpace() {
  return PAGEPOOL_NAMESPACE::EnsureFreeSpace(
      options_, persistence_enabled_, page_memory_.get(), free_list_.get(),
      tracker_.get(), info_log_.get());
}

Status RegionImpl::InsertDataRow(uint32_t row_size, PageId* page_id) {
  Status s = EnsureFreeSpace();
  if (!s.ok()) {
    return s;
  }
  s = free_list_->InsertDataRow(row_size, page_id);
  if (s.ok()) {
    tracker_->TouchPage(*page_id);
  }
  return s;
}

Status RegionImpl::RemoveDataRow(PageId page_id, uint32_t row_size) {
  bool page_emptied = false;
  Status s = free_list_->RemoveDataRow(page_id, row_size, &page_emptied);
  if (s.ok() && page_emptied) {
    tracker_->ForgetPage(page_id);
  }
  return s;
}

void RegionImpl::TouchPage(PageId page_id) { tracker_->TouchPage(page_id); }

}  // namespace PAGEPOOL_NAMESPACE
