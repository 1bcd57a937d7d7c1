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

#ifndef QSPIPE_CLIENT_CREDENTIALS_H_
#define QSPIPE_CLIENT_CREDENTIALS_H_

#include <string>
#include <utility>

#include "boost/unordered_map.hpp"

namespace QSPipe {

namespace Client {

typedef std::pair<std::string, std::string> KeyIdToKeyPair;
typedef boost::unordered_map<std::string, KeyIdToKeyPair> BucketToKeyPairMap;
typedef BucketToKeyPairMap::const_iterator BucketToKeyPairMapConstIterator;

class Credentials {
 public:
  Credentials() {}

  Credentials(const std::string &accessKeyId, const std::string &secretKey)
      : m_accessKeyId(accessKeyId), m_secretKey(secretKey) {}

 public:
  const std::string &GetAccessKeyId() const { return m_accessKeyId; }
  const std::string &GetSecretKey() const { return m_secretKey; }

 private:
  std::string m_accessKeyId;
  std::string m_secretKey;
};

class CredentialsProvider {
 public:
  virtual Credentials GetCredentials(const std::string &bucket) const = 0;
  virtual ~CredentialsProvider() {}
};

class DefaultCredentialsProvider : public CredentialsProvider {
 public:
  DefaultCredentialsProvider(const std::string &accessKeyId,
                             const std::string &secretKey)
      : m_defaultAccessKeyId(accessKeyId), m_defaultSecretKey(secretKey) {}

  // Throw QSPipeException if the file cannot be read or is malformed
  explicit DefaultCredentialsProvider(const std::string &credentialFile);

  // Get key pair of bucket, fall back to the default key pair
  //
  // Throw QSPipeException if there is neither.
  Credentials GetCredentials(const std::string &bucket) const;

  bool HasDefaultKey() const {
    return (!m_defaultAccessKeyId.empty()) && (!m_defaultSecretKey.empty());
  }

 private:
  // Read credentials file
  //
  // @param  : credentials file path
  // @return : a pair of {true, ""} or {false, message}
  //
  // Credentials file format: [bucket:]AccessKeyId:SecretKey
  // Lines beginning with # and empty lines are ignored. Lines without ":",
  // with space or tab, or starting with "[" are errors.
  // Only the first default key pair is used.
  std::pair<bool, std::string> ReadCredentialsFile(const std::string &file);

 private:
  std::string m_credentialsFile;
  std::string m_defaultAccessKeyId;
  std::string m_defaultSecretKey;
  BucketToKeyPairMap m_bucketMap;
};

// Pick the credentials file to use
//
// @param  : file given on command line, may be empty
// @return : the given file, or the first existing one of
//           $HOME/.qingstor/qspipe.cred and /etc/qspipe.cred
std::string ResolveCredentialsFile(const std::string &specified);

}  // namespace Client
}  // namespace QSPipe

#endif  // QSPIPE_CLIENT_CREDENTIALS_H_
