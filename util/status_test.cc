//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "pagepool/status.h"

#include <utility>

#include "port/port.h"
#include "test_util/testharness.h"

namespace PAGEPOOL_NAMESPACE {

TEST(StatusTest, ToString) {
  ASSERT_EQ("OK", Status::OK().ToString());
  ASSERT_EQ("NotFound: ", Status::NotFound().ToString());
  ASSERT_EQ("NotFound: Requested region is not configured: r1",
            Status::NotFound("Requested region is not configured", "r1")
                .ToString());
  ASSERT_EQ("Not implemented: x", Status::NotSupported("x").ToString());
  ASSERT_EQ("Invalid argument: x", Status::InvalidArgument("x").ToString());
  ASSERT_EQ("IO error: x", Status::IOError("x").ToString());
  ASSERT_EQ("Result incomplete: x", Status::Incomplete("x").ToString());
  ASSERT_EQ("Shutdown in progress: x",
            Status::ShutdownInProgress("x").ToString());
  ASSERT_EQ("Operation aborted: x", Status::Aborted("x").ToString());
}

TEST(StatusTest, CodesAndCopies) {
  Status s = Status::Aborted("Out of memory in region", "r1");
  ASSERT_TRUE(s.IsAborted());
  ASSERT_FALSE(s.ok());
  ASSERT_FALSE(s.IsIOError());

  Status copy = s;
  ASSERT_EQ(s.ToString(), copy.ToString());
  ASSERT_TRUE(copy == s);

  Status moved = std::move(copy);
  ASSERT_TRUE(moved.IsAborted());
  ASSERT_TRUE(copy.ok());
  ASSERT_TRUE(moved != Status::OK());
}

}  // namespace PAGEPOOL_NAMESPACE

int main(int argc, char** argv) {
  PAGEPOOL_NAMESPACE::port::InstallStackTraceHandler();
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
