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

#include "base/LogLevel.h"

#include <string>

#include "base/StringUtils.h"

namespace QSPipe {

namespace Logging {

using std::string;

namespace {

struct LogLevelName {
  LogLevel::Value level;
  const char *name;   // as printed in log prefix
  const char *alias;  // accepted as well when parsing
};

const LogLevelName logLevelNames[] = {
    {LogLevel::Info, "INFO", "info"},
    {LogLevel::Warn, "WARN", "warning"},
    {LogLevel::Error, "ERROR", "error"},
    {LogLevel::Fatal, "FATAL", "fatal"},
};

const int numLogLevels = sizeof(logLevelNames) / sizeof(logLevelNames[0]);

// Return index in logLevelNames, or -1 if not found
int FindLogLevel(const string &name) {
  string lowercase = QSPipe::StringUtils::ToLower(
      QSPipe::StringUtils::Trim(name, ' '));
  for (int i = 0; i < numLogLevels; ++i) {
    if (lowercase == QSPipe::StringUtils::ToLower(logLevelNames[i].name) ||
        lowercase == logLevelNames[i].alias) {
      return i;
    }
  }
  return -1;
}

}  // namespace

// --------------------------------------------------------------------------
string GetLogLevelName(LogLevel::Value logLevel) {
  for (int i = 0; i < numLogLevels; ++i) {
    if (logLevelNames[i].level == logLevel) {
      return logLevelNames[i].name;
    }
  }
  return string();
}

// --------------------------------------------------------------------------
bool IsLogLevelName(const string &name) { return FindLogLevel(name) >= 0; }

// --------------------------------------------------------------------------
LogLevel::Value GetLogLevelByName(const string &name) {
  int idx = FindLogLevel(name);
  return idx < 0 ? LogLevel::Info : logLevelNames[idx].level;
}

// --------------------------------------------------------------------------
string GetLogLevelPrefix(LogLevel::Value logLevel) {
  return "[" + GetLogLevelName(logLevel) + "] ";
}

}  // namespace Logging
}  // namespace QSPipe
