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

#ifndef QSPIPE_CONFIGURE_OPTIONS_H_
#define QSPIPE_CONFIGURE_OPTIONS_H_

#include <stddef.h>
#include <stdint.h>  // for uint16_t

#include <ostream>
#include <string>

#include "base/LogLevel.h"
#include "base/Singleton.hpp"

namespace QSPipe {

namespace CLI {

namespace Parser {
void Parse(int argc, char **argv);

}  // namespace Parser
}  // namespace CLI

namespace Configure {

using QSPipe::Logging::LogLevel;

class Options : public Singleton<Options> {
 public:
  bool IsNoUpload() const { return m_showHelp || m_showVersion; }

  // accessor
  const std::string &GetTarget() const { return m_target; }
  const std::string &GetBucket() const { return m_bucket; }
  const std::string &GetObjectKey() const { return m_objectKey; }
  uint64_t GetInputSize() const { return m_inputSize; }
  uint32_t GetPartSizeInMB() const { return m_partSizeInMB; }
  bool IsPartSizeSpecified() const { return m_partSizeSpecified; }
  size_t GetConcurrency() const { return m_concurrency; }
  bool IsAutoPartSize() const { return m_autoPartSize; }
  uint64_t GetMemoryLimitInMB() const { return m_memoryLimitInMB; }
  uint64_t GetMemoryReserveInMB() const { return m_memoryReserveInMB; }
  const std::string &GetZone() const { return m_zone; }
  const std::string &GetHost() const { return m_host; }
  const std::string &GetProtocol() const { return m_protocol; }
  uint16_t GetPort() const { return m_port; }
  uint16_t GetRetries() const { return m_retries; }
  uint32_t GetRequestTimeOut() const { return m_requestTimeOut; }
  const std::string &GetCredentialsFile() const { return m_credentialsFile; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  bool IsDebug() const { return m_debug; }
  bool IsShowHelp() const { return m_showHelp; }
  bool IsShowVersion() const { return m_showVersion; }

 private:
  Options();

  // Restore all values to defaults before parsing a new command line
  void Reset();

  std::string m_target;  // scheme://bucket/key
  std::string m_bucket;
  std::string m_objectKey;
  uint64_t m_inputSize;  // in bytes
  uint32_t m_partSizeInMB;
  bool m_partSizeSpecified;
  size_t m_concurrency;
  bool m_autoPartSize;          // derive part size from memory
  uint64_t m_memoryLimitInMB;   // 0 means use available system memory
  uint64_t m_memoryReserveInMB;
  std::string m_zone;
  std::string m_host;
  std::string m_protocol;
  uint16_t m_port;
  uint16_t m_retries;         // sdk connection retries
  uint32_t m_requestTimeOut;  // in seconds
  std::string m_credentialsFile;
  std::string m_logDirectory;  // log to console if empty
  LogLevel::Value m_logLevel;
  bool m_debug;
  bool m_showHelp;
  bool m_showVersion;

  friend class Singleton<Options>;
  friend void QSPipe::CLI::Parser::Parse(int argc, char **argv);
  friend std::ostream &operator<<(std::ostream &os, const Options &opts);
};

std::ostream &operator<<(std::ostream &os, const Options &opts);

}  // namespace Configure
}  // namespace QSPipe

#endif  // QSPIPE_CONFIGURE_OPTIONS_H_
