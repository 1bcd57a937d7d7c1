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

#include "configure/Options.h"

#include <ostream>
#include <string>

#include "boost/exception/to_string.hpp"

#include "base/LogLevel.h"
#include "configure/Default.h"

namespace QSPipe {

namespace Configure {

using boost::to_string;
using QSPipe::Configure::Default::GetDefaultConcurrency;
using QSPipe::Configure::Default::GetDefaultHostName;
using QSPipe::Configure::Default::GetDefaultLogLevelName;
using QSPipe::Configure::Default::GetDefaultMemoryReserveMB;
using QSPipe::Configure::Default::GetDefaultPartSizeMB;
using QSPipe::Configure::Default::GetDefaultPort;
using QSPipe::Configure::Default::GetDefaultProtocolName;
using QSPipe::Configure::Default::GetDefaultTransactionRetries;
using QSPipe::Configure::Default::GetDefaultTransactionTimeDuration;
using QSPipe::Configure::Default::GetDefaultZone;
using QSPipe::Logging::GetLogLevelByName;
using QSPipe::Logging::GetLogLevelName;
using std::ostream;
using std::string;

// --------------------------------------------------------------------------
Options::Options() { Reset(); }

// --------------------------------------------------------------------------
void Options::Reset() {
  m_target.clear();
  m_bucket.clear();
  m_objectKey.clear();
  m_inputSize = 0;
  m_partSizeInMB = GetDefaultPartSizeMB();
  m_partSizeSpecified = false;
  m_concurrency = GetDefaultConcurrency();
  m_autoPartSize = false;
  m_memoryLimitInMB = 0;
  m_memoryReserveInMB = GetDefaultMemoryReserveMB();
  m_zone = GetDefaultZone();
  m_host = GetDefaultHostName();
  m_protocol = GetDefaultProtocolName();
  m_port = GetDefaultPort(GetDefaultProtocolName());
  m_retries = GetDefaultTransactionRetries();
  m_requestTimeOut = GetDefaultTransactionTimeDuration();
  m_credentialsFile.clear();  // look up default locations
  m_logDirectory.clear();
  m_logLevel = GetLogLevelByName(GetDefaultLogLevelName());
  m_debug = false;
  m_showHelp = false;
  m_showVersion = false;
}

// --------------------------------------------------------------------------
ostream &operator<<(ostream &os, const Options &opts) {
  return os << "[target: " << opts.m_target << "] "
            << "[bucket: " << opts.m_bucket << "] "
            << "[key: " << opts.m_objectKey << "] "
            << "[size: " << to_string(opts.m_inputSize) << "] "
            << "[part size(MB): " << to_string(opts.m_partSizeInMB) << "] "
            << "[concurrency: " << to_string(opts.m_concurrency) << "] "
            << "[memory limit(MB): " << to_string(opts.m_memoryLimitInMB)
            << "] "
            << "[memory reserve(MB): " << to_string(opts.m_memoryReserveInMB)
            << "] "
            << "[zone: " << opts.m_zone << "] "
            << "[host: " << opts.m_host << "] "
            << "[protocol: " << opts.m_protocol << "] "
            << "[port: " << to_string(opts.m_port) << "] "
            << "[retries: " << to_string(opts.m_retries) << "] "
            << "[req timeout(s): " << to_string(opts.m_requestTimeOut) << "] "
            << "[credentials: " << opts.m_credentialsFile << "] "
            << "[log directory: " << opts.m_logDirectory << "] "
            << "[log level: " << GetLogLevelName(opts.m_logLevel) << "] "
            << std::boolalpha
            << "[auto part size: " << opts.m_autoPartSize << "] "
            << "[debug: " << opts.m_debug << "] "
            << "[show help: " << opts.m_showHelp << "] "
            << "[show version: " << opts.m_showVersion << "]"
            << std::noboolalpha;
}

}  // namespace Configure
}  // namespace QSPipe
