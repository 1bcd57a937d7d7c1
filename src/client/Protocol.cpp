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

#include "client/Protocol.h"

#include <string>

#include "base/LogMacros.h"
#include "base/StringUtils.h"

namespace QSPipe {

namespace Client {

namespace Http {

using std::string;

static const char* const HTTP_NAME = "http";
static const char* const HTTPS_NAME = "https";

namespace {

string Normalize(const string& name) {
  return QSPipe::StringUtils::ToLower(QSPipe::StringUtils::Trim(name, ' '));
}

}  // namespace

// --------------------------------------------------------------------------
string ProtocolToString(Protocol::Value protocol) {
  return protocol == Protocol::HTTP ? HTTP_NAME : HTTPS_NAME;
}

// --------------------------------------------------------------------------
Protocol::Value StringToProtocol(const string& name) {
  string str = Normalize(name);
  if (str == HTTP_NAME) {
    return Protocol::HTTP;
  }
  DebugWarningIf(str != HTTPS_NAME,
                 "Unrecognized protocol " << name << ", use https");
  return Protocol::HTTPS;
}

// --------------------------------------------------------------------------
bool IsProtocolName(const string& name) {
  string str = Normalize(name);
  return str == HTTP_NAME || str == HTTPS_NAME;
}

}  // namespace Http
}  // namespace Client
}  // namespace QSPipe
