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

namespace {

using QSPipe::Exception::ConfigError;
using QSPipe::Exception::InputError;
using QSPipe::Exception::QSPipeException;
using QSPipe::Exception::SessionError;
using QSPipe::Exception::UploadError;
using std::string;

static const char *const testMsg = "test QSPipeException";

void ThrowException() { throw QSPipeException(testMsg); }

string GetExceptionMsg() {
  try {
    ThrowException();
  } catch (const QSPipeException &err) {
    return err.get();
  }
  return string();
}

// Raise through a base reference, as done for errors captured by workers
void RaiseAsBase(const QSPipeException &err) { err.Raise(); }

}  // namespace

TEST(QSPipeExceptionTest, DefaultTest) {
  EXPECT_EQ(GetExceptionMsg(), string(testMsg));
}

TEST(QSPipeExceptionTest, RaiseKeepsType) {
  EXPECT_THROW(RaiseAsBase(ConfigError("config")), ConfigError);
  EXPECT_THROW(RaiseAsBase(InputError("input")), InputError);
  EXPECT_THROW(RaiseAsBase(SessionError("session")), SessionError);
  EXPECT_THROW(RaiseAsBase(UploadError(2, "backend")), UploadError);
  EXPECT_THROW(RaiseAsBase(QSPipeException("base")), QSPipeException);
}

TEST(QSPipeExceptionTest, UploadErrorCarriesPart) {
  try {
    RaiseAsBase(UploadError(7, "NotFound, QingStorUploadMultipart:no such"));
    FAIL() << "UploadError is not thrown";
  } catch (const UploadError &err) {
    EXPECT_EQ(err.GetPartNumber(), 7);
    EXPECT_EQ(err.GetBackendError(),
              string("NotFound, QingStorUploadMultipart:no such"));
    EXPECT_EQ(err.get(), string("Fail to upload part 7: NotFound, "
                                "QingStorUploadMultipart:no such"));
  }
}

TEST(QSPipeExceptionTest, CatchAsBase) {
  try {
    throw InputError("Input truncated");
  } catch (const QSPipeException &err) {
    EXPECT_EQ(err.get(), string("Input truncated"));
  }
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
