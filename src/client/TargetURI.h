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

#ifndef QSPIPE_CLIENT_TARGETURI_H_
#define QSPIPE_CLIENT_TARGETURI_H_

#include <string>

namespace QSPipe {

namespace Client {

//
// TargetURI
//
// Destination object of an upload in form of scheme://bucket/key.
// Supported schemes are "qs" and "s3", QingStor serves the s3 compatible
// protocol as well.
//
class TargetURI {
 public:
  TargetURI(const std::string &scheme, const std::string &bucket,
            const std::string &key)
      : m_scheme(scheme), m_bucket(bucket), m_key(key) {}

  const std::string &GetScheme() const { return m_scheme; }
  const std::string &GetBucket() const { return m_bucket; }
  const std::string &GetKey() const { return m_key; }

  std::string ToString() const;

 private:
  std::string m_scheme;
  std::string m_bucket;
  std::string m_key;
};

// Parse target uri
//
// @param  : uri string
// @return : TargetURI
//
// The bucket is the text between "://" and the first following "/", the
// key is everything after that "/" (it may contain more "/").
// Throw ConfigError if the scheme is missing or unsupported, or if the
// bucket or key is missing.
TargetURI ParseTargetURI(const std::string &uri);

bool IsSupportedScheme(const std::string &scheme);

}  // namespace Client
}  // namespace QSPipe

#endif  // QSPIPE_CLIENT_TARGETURI_H_
