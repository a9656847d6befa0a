//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).
//
// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#include "pagepool/env.h"

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

#include "logging/logging.h"
#include "pagepool/system_clock.h"
#include "port/port.h"
#include "test_util/testharness.h"

namespace PAGEPOOL_NAMESPACE {

class EnvPosixTest : public testing::Test {
 public:
  EnvPosixTest()
      : env_(Env::Default()), dir_(test::PerThreadPath("env_posix_test")) {}

  void SetUp() override { ASSERT_OK(env_->CreateDirRecursively(dir_)); }

 protected:
  Env* env_;
  const std::string dir_;
};

TEST_F(EnvPosixTest, DirectoryLifecycle) {
  const std::string nested = dir_ + "/a/b/c";
  ASSERT_TRUE(env_->FileExists(nested).IsNotFound());
  ASSERT_OK(env_->CreateDirRecursively(nested));
  ASSERT_OK(env_->FileExists(nested));
  // Creating again is not an error.
  ASSERT_OK(env_->CreateDirRecursively(nested));
  ASSERT_OK(env_->CreateDirIfMissing(nested));

  std::vector<std::string> children;
  ASSERT_OK(env_->GetChildren(dir_ + "/a", &children));
  ASSERT_EQ(std::vector<std::string>{"b"}, children);

  ASSERT_NOK(env_->DeleteDir(dir_ + "/a"));
  ASSERT_OK(env_->DeleteDir(nested));
  ASSERT_OK(env_->DeleteDir(dir_ + "/a/b"));
  ASSERT_OK(env_->DeleteDir(dir_ + "/a"));
  ASSERT_TRUE(env_->GetChildren(dir_ + "/a", &children).IsIOError());
}

TEST_F(EnvPosixTest, CreateDirOverFile) {
  const std::string fname = dir_ + "/plain_file";
  {
    std::ofstream out(fname);
    out << "x";
  }
  Status s = env_->CreateDirIfMissing(fname);
  ASSERT_TRUE(s.IsIOError());
  ASSERT_TRUE(env_->CreateDirRecursively(fname + "/sub").IsIOError());
  ASSERT_OK(env_->DeleteFile(fname));
  ASSERT_TRUE(env_->DeleteFile(fname).IsIOError());
}

TEST_F(EnvPosixTest, MissingPathIsIOError) {
  const std::string missing = dir_ + "/missing";
  ASSERT_TRUE(env_->FileExists(missing).IsNotFound());

  std::vector<std::string> children;
  Status s = env_->GetChildren(missing, &children);
  ASSERT_TRUE(s.IsIOError()) << s.ToString();
  ASSERT_NE(std::string::npos, s.ToString().find("Path not found"));
  ASSERT_TRUE(env_->DeleteFile(missing + "/f").IsIOError());
  ASSERT_TRUE(env_->DeleteDir(missing).IsIOError());
  ASSERT_TRUE(env_->CreateDirIfMissing(missing + "/a/b").IsIOError());
}

TEST_F(EnvPosixTest, SystemInfo) {
  ASSERT_GT(env_->GetPhysicalMemorySize(), 0u);
  ASSERT_TRUE(env_->GetSystemClock() != nullptr);
  uint64_t before = env_->GetSystemClock()->NowMicros();
  env_->GetSystemClock()->SleepForMicroseconds(1000);
  ASSERT_GE(env_->GetSystemClock()->NowMicros(), before + 1000);
}

TEST_F(EnvPosixTest, FileLogger) {
  const std::string fname = dir_ + "/LOG";
  std::shared_ptr<Logger> logger;
  ASSERT_OK(env_->NewLogger(fname, &logger));
  logger->SetInfoLogLevel(InfoLogLevel::WARN_LEVEL);

  PAGEPOOL_LOG_INFO(logger, "filtered out %d", 1);
  logger->Flush();
  ASSERT_EQ(0u, logger->GetLogFileSize());

  PAGEPOOL_LOG_WARN(logger, "Region %s is not used as the default region",
                    "r1");
  PAGEPOOL_LOG_ERROR(logger, "Failed to start region %s", "r2");
  logger->Flush();
  ASSERT_GT(logger->GetLogFileSize(), 0u);
  ASSERT_OK(logger->Close());

  std::ifstream in(fname);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  ASSERT_EQ(2u, lines.size());
  ASSERT_NE(std::string::npos, lines[0].find("[WARN] "));
  ASSERT_NE(std::string::npos,
            lines[0].find("Region r1 is not used as the default region"));
  ASSERT_NE(std::string::npos, lines[1].find("[ERROR] "));
  ASSERT_NE(std::string::npos, lines[1].find("Failed to start region r2"));
  ASSERT_OK(env_->DeleteFile(fname));

  ASSERT_TRUE(env_->NewLogger(dir_ + "/missing/LOG", &logger).IsIOError());
  ASSERT_TRUE(logger == nullptr);
}

TEST(LoggingTest, NullLoggerIsIgnored) {
  std::shared_ptr<Logger> none;
  PAGEPOOL_LOG_WARN(none, "nowhere %d", 1);
  Logger* raw = nullptr;
  PAGEPOOL_LOG_ERROR(raw, "nowhere %d", 2);
}

}  // namespace PAGEPOOL_NAMESPACE

int main(int argc, char** argv) {
  PAGEPOOL_NAMESPACE::port::InstallStackTraceHandler();
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
