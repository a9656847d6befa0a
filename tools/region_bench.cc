//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#ifndef GFLAGS
#include <cstdio>
int main() {
  fprintf(stderr, "Please install gflags to run pagepool tools\n");
  return 1;
}
#else

#include <cinttypes>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "pagepool/convenience.h"
#include "pagepool/env.h"
#include "pagepool/region_registry.h"
#include "pagepool/system_clock.h"
#include "port/port.h"
#include "port/stack_trace.h"
#include "util/gflags_compat.h"
#include "util/mutexlock.h"
#include "util/random.h"
#include "util/stderr_logger.h"
#include "util/string_util.h"

using GFLAGS_NAMESPACE::ParseCommandLineFlags;
using GFLAGS_NAMESPACE::SetUsageMessage;

static constexpr uint32_t KiB = uint32_t{1} << 10;
static constexpr uint32_t MiB = KiB << 10;

DEFINE_uint32(threads, 8, "Number of concurrent threads to run.");
DEFINE_uint64(region_size, 512 * MiB, "Max size of the benchmarked region.");
DEFINE_uint32(page_size, 4 * KiB, "Size of a data page.");
DEFINE_uint32(row_bytes, 512, "Upper bound of the size of each row.");
DEFINE_uint64(ops_per_thread, 1000000U, "Number of operations per thread.");
DEFINE_string(eviction_mode, "kRandom2LRU",
              "Page eviction mode: kDisabled, kRandomLRU or kRandom2LRU.");
DEFINE_double(eviction_threshold, 0.9,
              "Fraction of the region kept before pages are evicted.");
DEFINE_uint32(empty_pages_pool_size, 100,
              "Empty pages pooled by eviction before an insert.");
DEFINE_bool(fair_fifo, false, "Use FIFO eviction in place of eviction_mode.");

DEFINE_uint32(insert_percent, 50,
              "Ratio of row inserts to total workload (expressed as a "
              "percentage)");
DEFINE_uint32(remove_percent, 20,
              "Ratio of row removals to total workload (expressed as a "
              "percentage)");
DEFINE_uint32(touch_percent, 30,
              "Ratio of page touches to total workload (expressed as a "
              "percentage)");

DEFINE_uint32(seed, 0, "Random seed to use. 0 = choose at random");
DEFINE_string(swap_file_path, "",
              "If set, back the region with memory-mapped files here.");
DEFINE_bool(verbose, false, "Log region activity at INFO level.");
DEFINE_string(log_file, "", "If set, write the info log here, not to stderr.");

namespace PAGEPOOL_NAMESPACE {

namespace {
// State shared by all concurrent executions of the same benchmark.
class SharedState {
 public:
  SharedState() : cv_(&mu_) {}

  port::Mutex* GetMutex() { return &mu_; }

  port::CondVar* GetCondVar() { return &cv_; }

  void IncInitialized() { num_initialized_++; }

  void IncDone() { num_done_++; }

  bool AllInitialized() const { return num_initialized_ >= FLAGS_threads; }

  bool AllDone() const { return num_done_ >= FLAGS_threads; }

  void SetStart() { start_ = true; }

  bool Started() const { return start_; }

  void AddStats(uint64_t inserts, uint64_t failed_inserts,
                uint64_t stale_removes) {
    MutexLock l(&mu_);
    inserts_ += inserts;
    failed_inserts_ += failed_inserts;
    stale_removes_ += stale_removes;
  }

  uint64_t inserts() const { return inserts_; }
  uint64_t failed_inserts() const { return failed_inserts_; }
  uint64_t stale_removes() const { return stale_removes_; }

 private:
  port::Mutex mu_;
  port::CondVar cv_;

  uint64_t num_initialized_ = 0;
  bool start_ = false;
  uint64_t num_done_ = 0;
  uint64_t inserts_ = 0;
  uint64_t failed_inserts_ = 0;
  uint64_t stale_removes_ = 0;
};

struct Row {
  PageId page_id;
  uint32_t size;
};

// Per-thread state for concurrent executions of the same benchmark.
struct ThreadState {
  uint32_t tid;
  Random64 rnd;
  SharedState* shared;
  Region* region;

  ThreadState(uint32_t index, SharedState* _shared, Region* _region)
      : tid(index),
        rnd(FLAGS_seed + 1 + index),
        shared(_shared),
        region(_region) {}
};
}  // namespace

class RegionBench {
 public:
  RegionBench() : clock_(SystemClock::Default().get()) {
    if (FLAGS_seed == 0) {
      FLAGS_seed = static_cast<uint32_t>(clock_->NowMicros());
    }
  }

  bool Run() {
    Status s = Activate();
    if (!s.ok()) {
      fprintf(stderr, "Failed to activate regions: %s\n",
              s.ToString().c_str());
      return false;
    }
    Region* region = nullptr;
    s = registry_->GetRegion(&region);
    if (!s.ok()) {
      fprintf(stderr, "%s\n", s.ToString().c_str());
      return false;
    }

    PrintEnv(region);
    SharedState shared;
    std::vector<std::unique_ptr<ThreadState> > threads(FLAGS_threads);
    std::vector<std::thread> workers;
    for (uint32_t i = 0; i < FLAGS_threads; i++) {
      threads[i].reset(new ThreadState(i, &shared, region));
      workers.emplace_back(ThreadBody, threads[i].get());
    }

    uint64_t start_time;
    {
      MutexLock l(shared.GetMutex());
      while (!shared.AllInitialized()) {
        shared.GetCondVar()->Wait();
      }
      // Record start time
      start_time = clock_->NowMicros();

      // Start all threads
      shared.SetStart();
      shared.GetCondVar()->SignalAll();

      // Wait threads to complete
      while (!shared.AllDone()) {
        shared.GetCondVar()->Wait();
      }
    }
    uint64_t elapsed_us = clock_->NowMicros() - start_time;
    for (auto& worker : workers) {
      worker.join();
    }

    double elapsed_secs = static_cast<double>(elapsed_us) / 1000000;
    uint64_t total_ops = FLAGS_ops_per_thread * FLAGS_threads;
    printf("Complete in %.3f s; Rough parallel ops/sec = %.0f\n",
           elapsed_secs, static_cast<double>(total_ops) / elapsed_secs);
    printf("Rows inserted: %" PRIu64 ", failed inserts: %" PRIu64
           ", removals of evicted rows: %" PRIu64 "\n",
           shared.inserts(), shared.failed_inserts(), shared.stale_removes());
    for (const auto& snapshot : registry_->GetMetricsSnapshots()) {
      printf("%s\n", snapshot.ToString().c_str());
    }
    if (FLAGS_verbose) {
      registry_->DumpStatistics();
    }
    registry_->Deactivate();
    return true;
  }

 private:
  Status Activate() {
    MemoryOptions base;
    base.page_size = FLAGS_page_size;
    base.default_region_name = "bench";
    base.override_fair_fifo_eviction = FLAGS_fair_fifo;
    const InfoLogLevel level =
        FLAGS_verbose ? InfoLogLevel::INFO_LEVEL : InfoLogLevel::WARN_LEVEL;
    if (FLAGS_log_file.empty()) {
      base.info_log = std::make_shared<StderrLogger>(level);
    } else {
      Status s = Env::Default()->NewLogger(FLAGS_log_file, &base.info_log);
      if (!s.ok()) {
        return s;
      }
      base.info_log->SetInfoLogLevel(level);
    }

    std::string region = "{name=bench;initial_size=" +
                         std::to_string(FLAGS_region_size) +
                         ";max_size=" + std::to_string(FLAGS_region_size) +
                         ";page_eviction_mode=" + FLAGS_eviction_mode +
                         ";eviction_threshold=" +
                         std::to_string(FLAGS_eviction_threshold) +
                         ";empty_pages_pool_size=" +
                         std::to_string(FLAGS_empty_pages_pool_size) +
                         ";metrics_enabled=true";
    if (!FLAGS_swap_file_path.empty()) {
      region += ";swap_file_path=" + FLAGS_swap_file_path;
    }
    region += "}";

    MemoryOptions options;
    Status s = GetMemoryOptionsFromString(base, "regions={" + region + "}",
                                          &options);
    if (s.ok()) {
      s = RegionRegistry::Activate(options, &registry_);
    }
    return s;
  }

  static void ThreadBody(ThreadState* thread) {
    SharedState* shared = thread->shared;

    {
      MutexLock l(shared->GetMutex());
      shared->IncInitialized();
      if (shared->AllInitialized()) {
        shared->GetCondVar()->SignalAll();
      }
      while (!shared->Started()) {
        shared->GetCondVar()->Wait();
      }
    }
    OperateRegion(thread);
    {
      MutexLock l(shared->GetMutex());
      shared->IncDone();
      if (shared->AllDone()) {
        shared->GetCondVar()->SignalAll();
      }
    }
  }

  static void OperateRegion(ThreadState* thread) {
    Region* region = thread->region;
    std::vector<Row> rows;
    uint64_t inserts = 0;
    uint64_t failed_inserts = 0;
    uint64_t stale_removes = 0;

    const uint32_t insert_threshold = FLAGS_insert_percent;
    const uint32_t remove_threshold = insert_threshold + FLAGS_remove_percent;
    for (uint64_t i = 0; i < FLAGS_ops_per_thread; i++) {
      uint32_t prob_op = static_cast<uint32_t>(thread->rnd.Uniform(100));
      if (prob_op < insert_threshold || rows.empty()) {
        Row row;
        row.size = 1 + static_cast<uint32_t>(
                           thread->rnd.Uniform(FLAGS_row_bytes));
        Status s = region->InsertDataRow(row.size, &row.page_id);
        if (s.ok()) {
          rows.push_back(row);
          inserts++;
        } else {
          failed_inserts++;
        }
      } else if (prob_op < remove_threshold) {
        size_t idx = static_cast<size_t>(thread->rnd.Uniform(rows.size()));
        Row row = rows[idx];
        rows[idx] = rows.back();
        rows.pop_back();
        // The page may have been evicted and reused since the insert.
        if (!region->RemoveDataRow(row.page_id, row.size).ok()) {
          stale_removes++;
        }
      } else {
        size_t idx = static_cast<size_t>(thread->rnd.Uniform(rows.size()));
        region->TouchPage(rows[idx].page_id);
      }
    }
    thread->shared->AddStats(inserts, failed_inserts, stale_removes);
  }

  void PrintEnv(Region* region) const {
    printf("pagepool region_bench\n");
    printf("Number of threads   : %u\n", FLAGS_threads);
    printf("Ops per thread      : %" PRIu64 "\n", FLAGS_ops_per_thread);
    printf("Region size         : %s\n",
           BytesToHumanString(FLAGS_region_size).c_str());
    printf("Page size           : %u\n", FLAGS_page_size);
    printf("Max row bytes       : %u\n", FLAGS_row_bytes);
    printf("Eviction tracker    : %s\n", region->GetEvictionTracker()->Name());
    printf("Eviction threshold  : %.3f\n", FLAGS_eviction_threshold);
    printf("Insert percentage   : %u%%\n", FLAGS_insert_percent);
    printf("Remove percentage   : %u%%\n", FLAGS_remove_percent);
    printf("Touch percentage    : %u%%\n", FLAGS_touch_percent);
    printf("Seed                : %u\n", FLAGS_seed);
    printf("----------------------------\n");
  }

  SystemClock* clock_;
  std::unique_ptr<RegionRegistry> registry_;
};

}  // namespace PAGEPOOL_NAMESPACE

int main(int argc, char** argv) {
  PAGEPOOL_NAMESPACE::port::InstallStackTraceHandler();
  SetUsageMessage(std::string("\nUSAGE:\n") + std::string(argv[0]) +
                  " [OPTIONS]...");
  ParseCommandLineFlags(&argc, &argv, true);

  if (FLAGS_threads == 0 || FLAGS_row_bytes == 0) {
    fprintf(stderr, "threads and row_bytes must be positive\n");
    return 1;
  }
  if (FLAGS_insert_percent + FLAGS_remove_percent + FLAGS_touch_percent !=
      100) {
    fprintf(stderr, "Operation percentages must add up to 100\n");
    return 1;
  }

  PAGEPOOL_NAMESPACE::RegionBench bench;
  return bench.Run() ? 0 : 1;
}

#endif  // GFLAGS
