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
#include <stdio.h>
#include <sys/stat.h>

#include <fstream>
#include <string>

#include "gtest/gtest.h"

#include "base/Exception.h"
#include "client/Credentials.h"

namespace {

using QSPipe::Client::Credentials;
using QSPipe::Client::DefaultCredentialsProvider;
using QSPipe::Client::ResolveCredentialsFile;
using QSPipe::Exception::QSPipeException;
using std::string;

static const char *const credFile = "/tmp/qspipe.test.cred";

void WriteCredentialsFile(const string &content, mode_t mode) {
  remove(credFile);
  {
    std::ofstream out(credFile);
    out << content;
  }
  chmod(credFile, mode);
}

class CredentialsTest : public ::testing::Test {
 protected:
  void TearDown() { remove(credFile); }
};

}  // namespace

TEST_F(CredentialsTest, KeyPairs) {
  WriteCredentialsFile(
      "# qspipe credentials\n"
      "\n"
      "DEFAULTKEYID:defaultsecret\n"
      "mybucket:BUCKETKEYID:bucketsecret\r\n"
      "OTHERKEYID:othersecret\n",
      S_IRUSR | S_IWUSR);
  DefaultCredentialsProvider provider(credFile);
  EXPECT_TRUE(provider.HasDefaultKey());

  Credentials bucketCred = provider.GetCredentials("mybucket");
  EXPECT_EQ(bucketCred.GetAccessKeyId(), string("BUCKETKEYID"));
  EXPECT_EQ(bucketCred.GetSecretKey(), string("bucketsecret"));

  // only the first default key pair is used
  Credentials defaultCred = provider.GetCredentials("otherbucket");
  EXPECT_EQ(defaultCred.GetAccessKeyId(), string("DEFAULTKEYID"));
  EXPECT_EQ(defaultCred.GetSecretKey(), string("defaultsecret"));
}

TEST_F(CredentialsTest, NoDefaultKey) {
  WriteCredentialsFile("mybucket:BUCKETKEYID:bucketsecret\n",
                       S_IRUSR | S_IWUSR);
  DefaultCredentialsProvider provider(credFile);
  EXPECT_FALSE(provider.HasDefaultKey());
  EXPECT_EQ(provider.GetCredentials("mybucket").GetAccessKeyId(),
            string("BUCKETKEYID"));
  EXPECT_THROW(provider.GetCredentials("otherbucket"), QSPipeException);
}

TEST_F(CredentialsTest, ReadableByOthers) {
  WriteCredentialsFile("KEYID:secret\n", S_IRUSR | S_IWUSR | S_IROTH);
  EXPECT_THROW(DefaultCredentialsProvider provider(credFile), QSPipeException);

  WriteCredentialsFile("KEYID:secret\n", S_IRUSR | S_IWUSR | S_IRGRP);
  EXPECT_THROW(DefaultCredentialsProvider provider(credFile), QSPipeException);
}

TEST_F(CredentialsTest, MalformedLine) {
  WriteCredentialsFile("KEYID secret\n", S_IRUSR | S_IWUSR);
  EXPECT_THROW(DefaultCredentialsProvider provider(credFile), QSPipeException);

  WriteCredentialsFile("KEYIDsecret\n", S_IRUSR | S_IWUSR);
  EXPECT_THROW(DefaultCredentialsProvider provider(credFile), QSPipeException);

  WriteCredentialsFile("[default]\nKEYID:secret\n", S_IRUSR | S_IWUSR);
  EXPECT_THROW(DefaultCredentialsProvider provider(credFile), QSPipeException);
}

TEST_F(CredentialsTest, MissingFile) {
  EXPECT_THROW(DefaultCredentialsProvider provider("/tmp/qspipe.no.such.cred"),
               QSPipeException);
  EXPECT_THROW(DefaultCredentialsProvider provider(""),
               QSPipeException);
}

TEST_F(CredentialsTest, KeyPairProvider) {
  DefaultCredentialsProvider provider("KEYID", "secret");
  EXPECT_TRUE(provider.HasDefaultKey());
  EXPECT_EQ(provider.GetCredentials("any").GetSecretKey(), string("secret"));
}

TEST_F(CredentialsTest, ResolveFile) {
  EXPECT_EQ(ResolveCredentialsFile(credFile), string(credFile));
  EXPECT_FALSE(ResolveCredentialsFile(string()).empty());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
