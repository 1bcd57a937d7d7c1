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

#include "base/Exception.h"
#include "client/TargetURI.h"

namespace {

using QSPipe::Client::IsSupportedScheme;
using QSPipe::Client::ParseTargetURI;
using QSPipe::Client::TargetURI;
using QSPipe::Exception::ConfigError;
using std::string;

}  // namespace

TEST(TargetURITest, Valid) {
  TargetURI uri = ParseTargetURI("qs://mybucket/backup.tar");
  EXPECT_EQ(uri.GetScheme(), string("qs"));
  EXPECT_EQ(uri.GetBucket(), string("mybucket"));
  EXPECT_EQ(uri.GetKey(), string("backup.tar"));
  EXPECT_EQ(uri.ToString(), string("qs://mybucket/backup.tar"));

  TargetURI uri1 = ParseTargetURI("s3://bucket/key");
  EXPECT_EQ(uri1.GetScheme(), string("s3"));
  EXPECT_EQ(uri1.GetBucket(), string("bucket"));
  EXPECT_EQ(uri1.GetKey(), string("key"));
}

TEST(TargetURITest, NestedKey) {
  TargetURI uri = ParseTargetURI("s3://bucket/dir/file.txt");
  EXPECT_EQ(uri.GetBucket(), string("bucket"));
  EXPECT_EQ(uri.GetKey(), string("dir/file.txt"));

  // split at the first slash only
  TargetURI uri1 = ParseTargetURI("qs://bucket//a/b/");
  EXPECT_EQ(uri1.GetBucket(), string("bucket"));
  EXPECT_EQ(uri1.GetKey(), string("/a/b/"));
}

TEST(TargetURITest, SchemeCase) {
  TargetURI uri = ParseTargetURI("QS://bucket/key");
  EXPECT_EQ(uri.GetScheme(), string("qs"));
  EXPECT_TRUE(IsSupportedScheme("S3"));
  EXPECT_FALSE(IsSupportedScheme("https"));
  EXPECT_FALSE(IsSupportedScheme(""));
}

TEST(TargetURITest, Invalid) {
  EXPECT_THROW(ParseTargetURI("https://bucket/key"), ConfigError);
  EXPECT_THROW(ParseTargetURI("bucket/key"), ConfigError);
  EXPECT_THROW(ParseTargetURI("://bucket/key"), ConfigError);
  EXPECT_THROW(ParseTargetURI("s3:///key"), ConfigError);
  EXPECT_THROW(ParseTargetURI("s3://bucket/"), ConfigError);
  EXPECT_THROW(ParseTargetURI("s3://bucket"), ConfigError);
  EXPECT_THROW(ParseTargetURI("s3://"), ConfigError);
  EXPECT_THROW(ParseTargetURI(""), ConfigError);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
