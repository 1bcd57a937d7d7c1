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

#include "client/TargetURI.h"

#include <string>

#include "base/Exception.h"
#include "base/StringUtils.h"

namespace QSPipe {

namespace Client {

using QSPipe::Exception::ConfigError;
using std::string;

static const char *const SCHEME_DELIM = "://";
static const char *const SUPPORTED_SCHEMES[] = {"qs", "s3"};

// --------------------------------------------------------------------------
string TargetURI::ToString() const {
  return m_scheme + SCHEME_DELIM + m_bucket + "/" + m_key;
}

// --------------------------------------------------------------------------
bool IsSupportedScheme(const string &scheme) {
  string lowercase = QSPipe::StringUtils::ToLower(scheme);
  int n = sizeof(SUPPORTED_SCHEMES) / sizeof(SUPPORTED_SCHEMES[0]);
  for (int i = 0; i < n; ++i) {
    if (lowercase == SUPPORTED_SCHEMES[i]) {
      return true;
    }
  }
  return false;
}

// --------------------------------------------------------------------------
TargetURI ParseTargetURI(const string &uri) {
  string::size_type schemeEnd = uri.find(SCHEME_DELIM);
  if (schemeEnd == string::npos || schemeEnd == 0) {
    throw ConfigError("Invalid target " + uri +
                      ": missing scheme, must start with qs:// or s3://");
  }

  string scheme = uri.substr(0, schemeEnd);
  if (!IsSupportedScheme(scheme)) {
    throw ConfigError("Invalid target " + uri + ": unsupported scheme " +
                      scheme + ", must start with qs:// or s3://");
  }

  string rest = uri.substr(schemeEnd + string(SCHEME_DELIM).size());
  string::size_type slash = rest.find('/');
  string bucket = rest.substr(0, slash);
  if (bucket.empty()) {
    throw ConfigError("Invalid target " + uri + ": missing bucket");
  }

  string key = slash == string::npos ? string() : rest.substr(slash + 1);
  if (key.empty()) {
    throw ConfigError("Invalid target " + uri + ": missing key");
  }

  return TargetURI(QSPipe::StringUtils::ToLower(scheme), bucket, key);
}

}  // namespace Client
}  // namespace QSPipe
