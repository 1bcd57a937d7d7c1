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
#include <vector>

#include "boost/bind.hpp"
#include "boost/thread/thread.hpp"
#include "gtest/gtest.h"

#include "base/Exception.h"
#include "data/CompletedPart.h"
#include "transfer/PartManifest.h"

namespace {

using QSPipe::Data::CompletedPart;
using QSPipe::Exception::SessionError;
using QSPipe::Transfer::PartManifest;
using std::string;
using std::vector;

string ETag(int partNumber) {
  return "etag-" + std::string(1, static_cast<char>('0' + partNumber % 10));
}

// Record parts of given parity, as two workers finishing in any order
void RecordParts(PartManifest *manifest, int first, int count) {
  for (int i = first; i <= count; i += 2) {
    manifest->Record(CompletedPart(i, ETag(i)));
  }
}

}  // namespace

TEST(PartManifestTest, Empty) {
  PartManifest manifest(3);
  EXPECT_EQ(manifest.GetPartCount(), 3);
  EXPECT_EQ(manifest.GetCompletedCount(), 0);
  EXPECT_FALSE(manifest.IsComplete());
  EXPECT_THROW(manifest.GetSortedParts(), SessionError);
}

TEST(PartManifestTest, OutOfOrder) {
  PartManifest manifest(3);
  EXPECT_TRUE(manifest.Record(CompletedPart(3, "c")));
  EXPECT_TRUE(manifest.Record(CompletedPart(1, "a")));
  EXPECT_FALSE(manifest.IsComplete());
  EXPECT_TRUE(manifest.Record(CompletedPart(2, "b")));
  EXPECT_TRUE(manifest.IsComplete());

  vector<CompletedPart> parts = manifest.GetSortedParts();
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0].GetPartNumber(), 1);
  EXPECT_EQ(parts[0].GetETag(), string("a"));
  EXPECT_EQ(parts[1].GetPartNumber(), 2);
  EXPECT_EQ(parts[1].GetETag(), string("b"));
  EXPECT_EQ(parts[2].GetPartNumber(), 3);
  EXPECT_EQ(parts[2].GetETag(), string("c"));
}

TEST(PartManifestTest, RejectInvalid) {
  PartManifest manifest(2);
  EXPECT_FALSE(manifest.Record(CompletedPart(0, "x")));
  EXPECT_FALSE(manifest.Record(CompletedPart(3, "x")));
  EXPECT_TRUE(manifest.Record(CompletedPart(1, "a")));
  // a slot is written only once
  EXPECT_FALSE(manifest.Record(CompletedPart(1, "b")));
  EXPECT_EQ(manifest.GetCompletedCount(), 1);

  try {
    manifest.GetSortedParts();
    FAIL() << "SessionError is not thrown";
  } catch (const SessionError &err) {
    EXPECT_EQ(err.get(), string("Part 2 of 2 is not uploaded"));
  }
}

TEST(PartManifestTest, ConcurrentRecord) {
  const int count = 1000;
  PartManifest manifest(count);
  boost::thread odd(boost::bind(RecordParts, &manifest, 1, count));
  boost::thread even(boost::bind(RecordParts, &manifest, 2, count));
  odd.join();
  even.join();

  EXPECT_TRUE(manifest.IsComplete());
  vector<CompletedPart> parts = manifest.GetSortedParts();
  ASSERT_EQ(parts.size(), static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    EXPECT_EQ(parts[i].GetPartNumber(), i + 1);
    EXPECT_EQ(parts[i].GetETag(), ETag(i + 1));
  }
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
