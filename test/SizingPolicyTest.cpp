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

#include <string>
#include <utility>

#include "boost/bind.hpp"
#include "gtest/gtest.h"

#include "base/Exception.h"
#include "base/Size.h"
#include "transfer/SizingPolicy.h"

namespace {

using QSPipe::Exception::ConfigError;
using QSPipe::Size::GB1;
using QSPipe::Size::GB5;
using QSPipe::Size::MB1;
using QSPipe::Size::MB5;
using QSPipe::Size::MB64;
using QSPipe::Size::MB128;
using QSPipe::Transfer::CalculatePartCount;
using QSPipe::Transfer::MemoryProbe;
using QSPipe::Transfer::SizingPolicy;
using QSPipe::Transfer::SizingRequest;
using std::make_pair;
using std::pair;
using std::string;

pair<uint64_t, string> FixedMemory(uint64_t bytes) {
  return make_pair(bytes, string());
}

pair<uint64_t, string> NoMemoryInfo() {
  return make_pair(0, string("No MemAvailable entry found in /proc/meminfo"));
}

MemoryProbe Available(uint64_t bytes) {
  return boost::bind(FixedMemory, bytes);
}

SizingRequest MakeRequest(uint64_t inputSize, uint64_t partSize) {
  SizingRequest request;
  request.inputSize = inputSize;
  request.partSize = partSize;
  return request;
}

SizingRequest MakeMemoryRequest(uint64_t inputSize, uint64_t memoryLimit,
                                uint64_t memoryReserve, size_t concurrency) {
  SizingRequest request;
  request.inputSize = inputSize;
  request.memoryLimit = memoryLimit;
  request.memoryReserve = memoryReserve;
  request.concurrency = concurrency;
  return request;
}

}  // namespace

TEST(SizingPolicyTest, PartCount) {
  EXPECT_EQ(CalculatePartCount(1, MB5), 1u);
  EXPECT_EQ(CalculatePartCount(MB5, MB5), 1u);
  EXPECT_EQ(CalculatePartCount(MB5 + 1, MB5), 2u);
  EXPECT_EQ(CalculatePartCount(10 * MB1, MB5), 2u);
  EXPECT_EQ(CalculatePartCount(11 * MB1, MB5), 3u);
  EXPECT_EQ(CalculatePartCount(0, MB5), 0u);
  EXPECT_THROW(CalculatePartCount(1, 0), ConfigError);
}

TEST(SizingPolicyTest, DefaultConstraints) {
  SizingPolicy policy;
  EXPECT_EQ(policy.GetMinPartSize(), MB5);
  EXPECT_EQ(policy.GetMaxPartSize(), GB5);
  EXPECT_EQ(policy.GetMaxPartCount(), 10000u);
}

TEST(SizingPolicyTest, InvalidRequest) {
  SizingPolicy policy(MB5, GB5, 10000, Available(GB1));
  EXPECT_THROW(policy.CalculatePartSize(MakeRequest(0, MB64)), ConfigError);

  SizingRequest request = MakeRequest(MB64, MB64);
  request.concurrency = 0;
  EXPECT_THROW(policy.CalculatePartSize(request), ConfigError);
}

TEST(SizingPolicyTest, ExplicitPartSize) {
  SizingPolicy policy(MB5, GB5, 10000, Available(GB1));
  EXPECT_EQ(policy.CalculatePartSize(MakeRequest(GB1, MB64)), MB64);
  EXPECT_EQ(policy.CalculatePartSize(MakeRequest(1, MB5)), MB5);
  EXPECT_THROW(policy.CalculatePartSize(MakeRequest(GB1, MB5 - 1)),
               ConfigError);
  // clamped with a warning
  EXPECT_EQ(policy.CalculatePartSize(MakeRequest(GB1, 6 * GB1)), GB5);
}

TEST(SizingPolicyTest, SystemMemoryBudget) {
  SizingPolicy policy(MB5, GB5, 10000, Available(GB1));
  // (1024MB - 128MB) / (3 + 1) buffers
  EXPECT_EQ(policy.CalculatePartSize(MakeMemoryRequest(GB1, 0, MB128, 3)),
            224 * MB1);
  // (1024MB - 128MB) / (1 + 1) buffers
  EXPECT_EQ(policy.CalculatePartSize(MakeMemoryRequest(GB1, 0, MB128, 1)),
            448 * MB1);
}

TEST(SizingPolicyTest, MemoryLimitBudget) {
  // a given limit never asks the system
  SizingPolicy policy(MB5, GB5, 10000, NoMemoryInfo);
  EXPECT_EQ(
      policy.CalculatePartSize(MakeMemoryRequest(GB1, 512 * MB1, MB128, 1)),
      192 * MB1);
  // rounded down to whole MB
  EXPECT_EQ(policy.CalculatePartSize(
                MakeMemoryRequest(GB1, 1000 * MB1 + 123456, 0, 1)),
            500 * MB1);
  // raised to min part size
  EXPECT_EQ(
      policy.CalculatePartSize(MakeMemoryRequest(GB1, 130 * MB1, MB128, 1)),
      MB5);
  // cut down to max part size
  EXPECT_EQ(policy.CalculatePartSize(MakeMemoryRequest(GB1, 20 * GB1, 0, 1)),
            GB5);
}

TEST(SizingPolicyTest, NoUsableMemory) {
  SizingPolicy policy(MB5, GB5, 10000, NoMemoryInfo);
  EXPECT_THROW(policy.CalculatePartSize(MakeMemoryRequest(GB1, 0, MB128, 1)),
               ConfigError);

  SizingPolicy policy1(MB5, GB5, 10000, Available(MB64));
  EXPECT_THROW(policy1.CalculatePartSize(MakeMemoryRequest(GB1, 0, MB128, 1)),
               ConfigError);
  EXPECT_THROW(
      policy1.CalculatePartSize(MakeMemoryRequest(GB1, MB128, MB128, 1)),
      ConfigError);
}

TEST(SizingPolicyTest, PartCountLimit) {
  SizingPolicy policy(MB5, GB5, 2, Available(GB1));
  // 3 parts of 5MB are needed, raise to ceil(11MB / 2) in whole MB
  EXPECT_EQ(policy.CalculatePartSize(MakeRequest(11 * MB1, MB5)), 6 * MB1);
  EXPECT_EQ(policy.CalculatePartSize(MakeRequest(10 * MB1, MB5)), MB5);
  // no part size can hold it
  EXPECT_THROW(policy.CalculatePartSize(MakeRequest(2 * GB5 + 1, MB5)),
               ConfigError);
}

TEST(SizingPolicyTest, BackendPartCountLimit) {
  SizingPolicy policy(MB5, GB5, 10000, Available(GB1));
  uint64_t size = 100 * GB1;
  uint64_t partSize = policy.CalculatePartSize(MakeRequest(size, MB5));
  EXPECT_EQ(partSize, 11 * MB1);
  EXPECT_LE(CalculatePartCount(size, partSize), 10000u);
  EXPECT_GT(CalculatePartCount(size, partSize - MB1), 10000u);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
