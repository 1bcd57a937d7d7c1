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
#include <stdint.h>
#include <stdio.h>
#include <unistd.h>

#include <fstream>
#include <string>
#include <utility>

#include "gtest/gtest.h"

#include "base/Utils.h"

namespace {

using QSPipe::Utils::CreateDirectoryIfNotExists;
using QSPipe::Utils::FileExists;
using QSPipe::Utils::GetAvailableMemory;
using QSPipe::Utils::GetDirName;
using QSPipe::Utils::IsDirectory;
using QSPipe::Utils::ParseMemAvailable;
using std::pair;
using std::string;

static const char *const meminfoFile = "/tmp/qspipe.test.meminfo";

void WriteFile(const string &path, const string &content) {
  std::ofstream out(path.c_str());
  out << content;
}

}  // namespace

TEST(UtilsTest, DirName) {
  EXPECT_EQ(GetDirName("/"), string("/"));
  EXPECT_EQ(GetDirName("/tmp/qspipe.log"), string("/tmp/"));
  EXPECT_EQ(GetDirName("/tmp/qspipe_log/"), string("/tmp/"));
}

TEST(UtilsTest, CreateDirectory) {
  string dir = "/tmp/qspipe.test.dir/sub/";
  EXPECT_TRUE(CreateDirectoryIfNotExists(dir));
  EXPECT_TRUE(FileExists(dir));
  EXPECT_TRUE(IsDirectory(dir).first);
  // already there
  EXPECT_TRUE(CreateDirectoryIfNotExists(dir));
  rmdir("/tmp/qspipe.test.dir/sub");
  rmdir("/tmp/qspipe.test.dir");

  EXPECT_FALSE(CreateDirectoryIfNotExists(""));
  EXPECT_FALSE(IsDirectory("/tmp/qspipe.no.such.dir").first);
}

TEST(UtilsTest, ParseMemAvailable) {
  WriteFile(meminfoFile,
            "MemTotal:       16323452 kB\n"
            "MemFree:         1203040 kB\n"
            "MemAvailable:    8388608 kB\n"
            "Buffers:          332120 kB\n");
  pair<uint64_t, string> outcome = ParseMemAvailable(meminfoFile);
  EXPECT_EQ(outcome.first, 8388608ULL * 1024);
  EXPECT_TRUE(outcome.second.empty());
  remove(meminfoFile);
}

TEST(UtilsTest, ParseMemAvailableMissing) {
  // kernels before 3.14 do not report it
  WriteFile(meminfoFile,
            "MemTotal:       16323452 kB\n"
            "MemFree:         1203040 kB\n");
  pair<uint64_t, string> outcome = ParseMemAvailable(meminfoFile);
  EXPECT_EQ(outcome.first, 0u);
  EXPECT_FALSE(outcome.second.empty());
  remove(meminfoFile);

  outcome = ParseMemAvailable("/tmp/qspipe.no.such.meminfo");
  EXPECT_EQ(outcome.first, 0u);
  EXPECT_FALSE(outcome.second.empty());
}

TEST(UtilsTest, AvailableMemory) {
  pair<uint64_t, string> outcome = GetAvailableMemory();
  EXPECT_GT(outcome.first, 0u) << outcome.second;
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
