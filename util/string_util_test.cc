//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#include "util/string_util.h"

#include <stdexcept>

#include "port/port.h"
#include "test_util/testharness.h"

namespace PAGEPOOL_NAMESPACE {

TEST(StringUtilTest, BytesToHumanString) {
  ASSERT_EQ("0.00 KB", BytesToHumanString(0));
  ASSERT_EQ("1.00 KB", BytesToHumanString(1024));
  ASSERT_EQ("5.00 MB", BytesToHumanString(5ull << 20));
  ASSERT_EQ("1.50 GB", BytesToHumanString(3ull << 29));
  ASSERT_EQ("2048.00 TB", BytesToHumanString(1ull << 51));
}

TEST(StringUtilTest, ParseSizes) {
  ASSERT_EQ(10u, ParseUint64("10"));
  ASSERT_EQ(8u << 10, ParseUint64("8K"));
  ASSERT_EQ(256ull << 20, ParseUint64("256M"));
  ASSERT_EQ(2ull << 30, ParseUint64("2g"));
  ASSERT_EQ(1ull << 40, ParseUint64("1T"));
  ASSERT_THROW(ParseUint64("-1"), std::invalid_argument);
  ASSERT_THROW(ParseUint64("10X"), std::invalid_argument);
  ASSERT_THROW(ParseUint64("10MB"), std::invalid_argument);

  ASSERT_EQ(4096u, ParseUint32("4K"));
  ASSERT_THROW(ParseUint32("8G"), std::out_of_range);
  ASSERT_EQ(-3, ParseInt("-3"));
  ASSERT_DOUBLE_EQ(0.9, ParseDouble("0.9"));
  ASSERT_THROW(ParseDouble("0.9x"), std::invalid_argument);
}

TEST(StringUtilTest, ParseBoolean) {
  ASSERT_TRUE(ParseBoolean("metrics_enabled", "true"));
  ASSERT_TRUE(ParseBoolean("metrics_enabled", "1"));
  ASSERT_FALSE(ParseBoolean("metrics_enabled", "false"));
  ASSERT_THROW(ParseBoolean("metrics_enabled", "yes"), std::invalid_argument);
}

TEST(StringUtilTest, SplitAndTrim) {
  std::vector<std::string> parts = StringSplit("a:b::c", ':');
  ASSERT_EQ(4u, parts.size());
  ASSERT_EQ("a", parts[0]);
  ASSERT_EQ("", parts[2]);
  ASSERT_EQ("c", parts[3]);

  ASSERT_EQ("name", trim("  name \t"));
  ASSERT_EQ("", trim(""));
  ASSERT_TRUE(StartsWith("sysMemPlc", "sys"));
  ASSERT_FALSE(StartsWith("sys", "sysMemPlc"));
  ASSERT_TRUE(EndsWith("allocator-0.bin", ".bin"));
  ASSERT_FALSE(EndsWith("bin", ".bin"));
}

TEST(StringUtilTest, ReplaceChars) {
  ASSERT_EQ("127_0_0_1_47500_node",
            ReplaceChars("127.0.0.1:47500,node", ":,.", '_'));
  ASSERT_EQ("local", ReplaceChars("local", ":,.", '_'));
}

}  // namespace PAGEPOOL_NAMESPACE

int main(int argc, char** argv) {
  PAGEPOOL_NAMESPACE::port::InstallStackTraceHandler();
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
