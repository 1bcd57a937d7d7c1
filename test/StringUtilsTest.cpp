// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------
#include <string>

#include "gtest/gtest.h"

#include "base/Size.h"
#include "base/StringUtils.h"

using std::string;

TEST(StringUtilsTest, ChangeCase) {
  string lowercase = "lowercase";
  EXPECT_EQ(lowercase, QSPipe::StringUtils::ToLower("LOWerCase"));
}

TEST(StringUtilsTest, Trim) {
  string raw = "    hello world    ";
  string notrailing = "    hello world";
  string noleading = "hello world    ";
  string noboth = "hello world";
  char ch = ' ';

  EXPECT_EQ(notrailing, QSPipe::StringUtils::RTrim(raw, ch));
  EXPECT_EQ(noleading, QSPipe::StringUtils::LTrim(raw, ch));
  EXPECT_EQ(noboth, QSPipe::StringUtils::Trim(raw, ch));
  EXPECT_EQ(string("/tmp/qspipe_log"),
            QSPipe::StringUtils::RTrim("/tmp/qspipe_log//", '/'));
}

TEST(StringUtilsTest, StartsWith) {
  using QSPipe::StringUtils::StartsWith;
  EXPECT_TRUE(StartsWith("qs://bucket/key", "qs://"));
  EXPECT_TRUE(StartsWith("qs", ""));
  EXPECT_FALSE(StartsWith("qs", "qs://"));
  EXPECT_FALSE(StartsWith("s3://bucket/key", "qs://"));
}

TEST(StringUtilsTest, FormatObject) {
  EXPECT_EQ(string("[bucket=mybucket, key=dir/file]"),
            QSPipe::StringUtils::FormatObject("mybucket", "dir/file"));
}

TEST(StringUtilsTest, FormatSize) {
  using QSPipe::StringUtils::FormatSize;
  EXPECT_EQ(string("0B"), FormatSize(0));
  EXPECT_EQ(string("123B"), FormatSize(123));
  EXPECT_EQ(string("1KB"), FormatSize(QSPipe::Size::KB1));
  EXPECT_EQ(string("5MB"), FormatSize(QSPipe::Size::MB5));
  EXPECT_EQ(string("5GB"), FormatSize(QSPipe::Size::GB5));
  EXPECT_EQ(string("1.50GB"),
            FormatSize(QSPipe::Size::GB1 + 512 * QSPipe::Size::MB1));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
