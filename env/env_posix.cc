//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).
//
// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <cassert>
#include <memory>
#include <string>
#include <vector>

#include "logging/env_logger.h"
#include "pagepool/env.h"
#include "pagepool/system_clock.h"
#include "port/port.h"

namespace PAGEPOOL_NAMESPACE {

namespace {

Status IOError(const std::string& context, const std::string& file_name,
               int err_number) {
  switch (err_number) {
    case ENOSPC:
      return Status::IOError(context + " " + file_name + ": No space left",
                             strerror(err_number));
    case ENOENT:
      return Status::IOError(context + " " + file_name + ": Path not found",
                             strerror(err_number));
    default:
      return Status::IOError(context + " " + file_name, strerror(err_number));
  }
}

class PosixClock : public SystemClock {
 public:
  const char* Name() const override { return "PosixClock"; }
  uint64_t NowMicros() override {
    struct timeval tv;
    gettimeofday(&tv, nullptr);
    return static_cast<uint64_t>(tv.tv_sec) * 1000000 + tv.tv_usec;
  }

  uint64_t NowNanos() override {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000000000 + ts.tv_nsec;
  }

  void SleepForMicroseconds(int micros) override { usleep(micros); }
};

class PosixEnv : public Env {
 public:
  PosixEnv() : clock_(SystemClock::Default()) {}
  ~PosixEnv() override {}

  Status FileExists(const std::string& fname) override {
    int result = access(fname.c_str(), F_OK);

    if (result == 0) {
      return Status::OK();
    }

    int err = errno;
    switch (err) {
      case EACCES:
      case ELOOP:
      case ENAMETOOLONG:
      case ENOENT:
      case ENOTDIR:
        return Status::NotFound();
      default:
        assert(err == EIO || err == ENOMEM);
        return Status::IOError("Unexpected error(" + std::to_string(err) +
                               ") accessing file `" + fname + "' ");
    }
  }

  Status GetChildren(const std::string& dir,
                     std::vector<std::string>* result) override {
    result->clear();
    DIR* d = opendir(dir.c_str());
    if (d == nullptr) {
      return IOError("While opendir", dir, errno);
    }
    struct dirent* entry;
    while ((entry = readdir(d)) != nullptr) {
      if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
        continue;
      }
      result->push_back(entry->d_name);
    }
    closedir(d);
    return Status::OK();
  }

  Status DeleteFile(const std::string& fname) override {
    if (unlink(fname.c_str()) != 0) {
      return IOError("while unlink() file", fname, errno);
    }
    return Status::OK();
  }

  Status CreateDirIfMissing(const std::string& name) override {
    if (mkdir(name.c_str(), 0755) != 0) {
      if (errno != EEXIST) {
        return IOError("While mkdir if missing", name, errno);
      }
      struct stat sbuf;
      if (stat(name.c_str(), &sbuf) != 0 || !S_ISDIR(sbuf.st_mode)) {
        // Check that name is actually a directory.
        // Message is taken from mkdir
        return Status::IOError("`" + name + "' exists but is not a directory");
      }
    }
    return Status::OK();
  }

  Status DeleteDir(const std::string& name) override {
    if (rmdir(name.c_str()) != 0) {
      return IOError("file rmdir", name, errno);
    }
    return Status::OK();
  }

  Status GetTestDirectory(std::string* result) override {
    const char* env = getenv("TEST_TMPDIR");
    if (env && env[0] != '\0') {
      *result = env;
    } else {
      char buf[100];
      snprintf(buf, sizeof(buf), "/tmp/pagepooltest-%d",
               static_cast<int>(geteuid()));
      *result = buf;
    }
    // Directory may already exist
    return CreateDirIfMissing(*result);
  }

  Status NewLogger(const std::string& fname,
                   std::shared_ptr<Logger>* result) override {
    FILE* f = fopen(fname.c_str(), "we");
    if (f == nullptr) {
      result->reset();
      return IOError("when fopen a file for new logger", fname, errno);
    }
    result->reset(new EnvLogger(f, fname, this));
    return Status::OK();
  }

  uint64_t GetPhysicalMemorySize() const override {
    return port::GetPhysicalMemorySize();
  }

  const std::shared_ptr<SystemClock>& GetSystemClock() const override {
    return clock_;
  }

 private:
  std::shared_ptr<SystemClock> clock_;
};

}  // namespace

//
// Default Posix Env
//
Env* Env::Default() {
  // SystemClock::Default() is constructed first so that it outlives
  // default_env, which holds a reference to it.
  SystemClock::Default();
  static PosixEnv default_env;
  return &default_env;
}

//
// Default Posix SystemClock
//
const std::shared_ptr<SystemClock>& SystemClock::Default() {
  static std::shared_ptr<SystemClock> default_clock =
      std::make_shared<PosixClock>();
  return default_clock;
}

}  // namespace PAGEPOOL_NAMESPACE
