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

#include "cli/Parser.h"

#include <stdint.h>

#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/program_options/options_description.hpp"
#include "boost/program_options/parsers.hpp"
#include "boost/program_options/positional_options.hpp"
#include "boost/program_options/variables_map.hpp"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/StringUtils.h"
#include "client/Protocol.h"
#include "client/TargetURI.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace QSPipe {

namespace CLI {

namespace Parser {

namespace po = boost::program_options;

namespace {

using boost::to_string;
using QSPipe::Configure::Default::GetDefaultPort;
using QSPipe::Configure::Default::GetMinPartSizeMB;
using QSPipe::Exception::ConfigError;
using std::string;

// --------------------------------------------------------------------------
po::options_description BuildOptionsDescription() {
  po::options_description desc("qspipe options");
  desc.add_options()
    ("size,s", po::value<int64_t>(), "exact input size in bytes")
    ("part-size,p", po::value<int64_t>(), "part size in MB")
    ("concurrency,c", po::value<int64_t>(), "parts uploaded in parallel")
    ("auto-part-size,a", "derive part size from memory")
    ("memory-limit,m", po::value<int64_t>(), "memory for buffers in MB")
    ("memory-reserve", po::value<int64_t>(), "memory kept out in MB")
    ("zone,z", po::value<string>(), "zone or region")
    ("host", po::value<string>(), "host name")
    ("protocol", po::value<string>(), "https or http")
    ("port", po::value<int64_t>(), "port")
    ("retries", po::value<int64_t>(), "retries of a failed request")
    ("timeout", po::value<int64_t>(), "request timeout in seconds")
    ("credentials", po::value<string>(), "credentials file")
    ("logdir,l", po::value<string>(), "log directory")
    ("loglevel,L", po::value<string>(), "INFO, WARN, ERROR or FATAL")
    ("debug,d", "turn on debug messages")
    ("help,h", "print help")
    ("version,V", "print version")
    ("target", po::value<string>(), "scheme://bucket/key");
  return desc;
}

// --------------------------------------------------------------------------
int64_t GetInteger(const po::variables_map &vm, const char *name,
                   int64_t minValue, int64_t maxValue) {
  int64_t value = vm[name].as<int64_t>();
  if (value < minValue || value > maxValue) {
    throw ConfigError("Invalid value " + to_string(value) + " of option --" +
                      name + ", should be in range [" + to_string(minValue) +
                      ", " + to_string(maxValue) + "]");
  }
  return value;
}

// --------------------------------------------------------------------------
string GetString(const po::variables_map &vm, const char *name) {
  string value = vm[name].as<string>();
  if (value.empty()) {
    throw ConfigError(string("Empty value of option --") + name);
  }
  return value;
}

}  // namespace

// --------------------------------------------------------------------------
void Parse(int argc, char **argv) {
  static const int64_t kMaxInt64 = 0x7fffffffffffffffLL;
  static const int64_t kMaxUInt16 = 0xffff;
  static const int64_t kMaxInt32 = 0x7fffffff;

  QSPipe::Configure::Options &qspipeOptions =
      QSPipe::Configure::Options::Instance();
  qspipeOptions.Reset();

  po::options_description desc = BuildOptionsDescription();
  po::positional_options_description positional;
  positional.add("target", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error &err) {
    throw ConfigError(err.what());
  }

  qspipeOptions.m_showHelp = vm.count("help") > 0;
  qspipeOptions.m_showVersion = vm.count("version") > 0;
  if (qspipeOptions.IsNoUpload()) {
    return;
  }

  // target
  if (vm.count("target") == 0) {
    throw ConfigError("Missing target, e.g. qs://mybucket/path/to/object");
  }
  qspipeOptions.m_target = vm["target"].as<string>();
  QSPipe::Client::TargetURI uri =
      QSPipe::Client::ParseTargetURI(qspipeOptions.m_target);
  qspipeOptions.m_bucket = uri.GetBucket();
  qspipeOptions.m_objectKey = uri.GetKey();

  // sizing
  if (vm.count("size") == 0) {
    throw ConfigError("Missing input size, specify it with -s|--size");
  }
  qspipeOptions.m_inputSize =
      static_cast<uint64_t>(GetInteger(vm, "size", 1, kMaxInt64));
  if (vm.count("part-size")) {
    qspipeOptions.m_partSizeInMB = static_cast<uint32_t>(
        GetInteger(vm, "part-size", GetMinPartSizeMB(), kMaxInt32));
    qspipeOptions.m_partSizeSpecified = true;
  }
  if (vm.count("concurrency")) {
    qspipeOptions.m_concurrency =
        static_cast<size_t>(GetInteger(vm, "concurrency", 1, kMaxInt32));
  }
  if (vm.count("memory-limit")) {
    qspipeOptions.m_memoryLimitInMB = static_cast<uint64_t>(
        GetInteger(vm, "memory-limit", 1, kMaxInt32));
  }
  if (vm.count("memory-reserve")) {
    qspipeOptions.m_memoryReserveInMB = static_cast<uint64_t>(
        GetInteger(vm, "memory-reserve", 0, kMaxInt32));
  }
  // a memory limit only makes sense for memory derived part size
  qspipeOptions.m_autoPartSize =
      vm.count("auto-part-size") > 0 || vm.count("memory-limit") > 0;

  // qingstor
  if (vm.count("zone")) {
    qspipeOptions.m_zone = GetString(vm, "zone");
  }
  if (vm.count("host")) {
    qspipeOptions.m_host = GetString(vm, "host");
  }
  if (vm.count("protocol")) {
    string protocol = GetString(vm, "protocol");
    if (!QSPipe::Client::Http::IsProtocolName(protocol)) {
      throw ConfigError("Invalid protocol " + protocol +
                        ", should be https or http");
    }
    qspipeOptions.m_protocol = QSPipe::StringUtils::ToLower(protocol);
    qspipeOptions.m_port = GetDefaultPort(qspipeOptions.m_protocol);
  }
  if (vm.count("port")) {
    qspipeOptions.m_port =
        static_cast<uint16_t>(GetInteger(vm, "port", 1, kMaxUInt16));
  }
  if (vm.count("retries")) {
    qspipeOptions.m_retries =
        static_cast<uint16_t>(GetInteger(vm, "retries", 0, kMaxUInt16));
  }
  if (vm.count("timeout")) {
    qspipeOptions.m_requestTimeOut =
        static_cast<uint32_t>(GetInteger(vm, "timeout", 1, kMaxInt32));
  }
  if (vm.count("credentials")) {
    qspipeOptions.m_credentialsFile = GetString(vm, "credentials");
  }

  // logging
  if (vm.count("logdir")) {
    qspipeOptions.m_logDirectory = GetString(vm, "logdir");
  }
  if (vm.count("loglevel")) {
    string level = GetString(vm, "loglevel");
    if (!QSPipe::Logging::IsLogLevelName(level)) {
      throw ConfigError("Invalid log level " + level +
                        ", should be one of INFO, WARN, ERROR, FATAL");
    }
    qspipeOptions.m_logLevel = QSPipe::Logging::GetLogLevelByName(level);
  }
  qspipeOptions.m_debug = vm.count("debug") > 0;
}

}  // namespace Parser
}  // namespace CLI
}  // namespace QSPipe
