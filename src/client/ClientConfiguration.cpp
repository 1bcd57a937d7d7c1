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

#include "client/ClientConfiguration.h"

#include <errno.h>
#include <string.h>  // for strerr

#include <string>

#include "boost/lexical_cast.hpp"

#include "base/Exception.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "client/Credentials.h"
#include "client/Protocol.h"
#include "configure/Default.h"
#include "configure/Options.h"
#include "configure/Version.h"

namespace QSPipe {

namespace Client {

using QSPipe::Exception::QSPipeException;
using QSPipe::Configure::Default::GetDefaultHostName;
using QSPipe::Configure::Default::GetDefaultLogDirectory;
using QSPipe::Configure::Default::GetDefaultPort;
using QSPipe::Configure::Default::GetDefaultProtocolName;
using QSPipe::Configure::Default::GetDefaultTransactionRetries;
using QSPipe::Configure::Default::GetDefaultTransactionTimeDuration;
using QSPipe::Configure::Default::GetDefaultZone;
using QSPipe::Configure::Default::GetProgramName;
using QSPipe::Configure::Default::GetSDKLogFolderBaseName;
using QSPipe::StringUtils::RTrim;
using std::string;

namespace {

string UserAgent() {
  return string(GetProgramName()) + "/" +
         QSPipe::Configure::Version::GetVersionString();
}

}  // namespace

// --------------------------------------------------------------------------
string GetClientLogLevelName(ClientLogLevel::Value level) {
  string name;
  switch (level) {
    case ClientLogLevel::Verbose:
      name = "verbose";
      break;
    case ClientLogLevel::Debug:
      name = "debug";
      break;
    case ClientLogLevel::Info:
      name = "info";
      break;
    case ClientLogLevel::Warn:
      name = "warning";
      break;
    case ClientLogLevel::Error:
      name = "error";
      break;
    case ClientLogLevel::Fatal:
      name = "fatal";
      break;
    default:
      break;
  }
  return name;
}

// --------------------------------------------------------------------------
ClientLogLevel::Value GetClientLogLevelByName(const string &name) {
  ClientLogLevel::Value level = ClientLogLevel::Warn;
  if (name.empty()) {
    return level;
  }

  string name_lowercase = QSPipe::StringUtils::ToLower(name);
  if (name_lowercase == "verbose") {
    level = ClientLogLevel::Verbose;
  } else if (name_lowercase == "debug") {
    level = ClientLogLevel::Debug;
  } else if (name_lowercase == "info") {
    level = ClientLogLevel::Info;
  } else if (name_lowercase == "error") {
    level = ClientLogLevel::Error;
  } else if (name_lowercase == "fatal") {
    level = ClientLogLevel::Fatal;
  }

  return level;
}

// --------------------------------------------------------------------------
ClientConfiguration::ClientConfiguration(const Credentials &credentials)
    : m_accessKeyId(credentials.GetAccessKeyId()),
      m_secretKey(credentials.GetSecretKey()),
      m_zone(GetDefaultZone()),
      m_host(GetDefaultHostName()),
      m_protocol(Http::StringToProtocol(GetDefaultProtocolName())),
      m_port(GetDefaultPort(GetDefaultProtocolName())),
      m_additionalUserAgent(UserAgent()),
      m_logLevel(ClientLogLevel::Warn),
      m_sdkLogDirectory(RTrim(GetDefaultLogDirectory(), '/') + "/" +
                        GetSDKLogFolderBaseName()),
      m_transactionRetries(GetDefaultTransactionRetries()),
      m_transactionTimeDuration(GetDefaultTransactionTimeDuration()) {}

// --------------------------------------------------------------------------
void ClientConfiguration::InitializeByOptions(
    const QSPipe::Configure::Options &options) {
  m_zone = options.GetZone();
  m_host = options.GetHost();
  m_protocol = Http::StringToProtocol(options.GetProtocol());
  m_port = options.GetPort();
  m_logLevel = static_cast<ClientLogLevel::Value>(options.GetLogLevel());
  if (options.IsDebug()) {
    m_logLevel = ClientLogLevel::Debug;
  }

  // sdk always logs into files, put them beside ours if any
  string logDir = options.GetLogDirectory().empty()
                      ? GetDefaultLogDirectory()
                      : options.GetLogDirectory();
  m_sdkLogDirectory = RTrim(logDir, '/') + "/" + GetSDKLogFolderBaseName();
  if (!QSPipe::Utils::CreateDirectoryIfNotExists(m_sdkLogDirectory)) {
    throw QSPipeException(string("Unable to create sdk log directory : ") +
                          strerror(errno) + " " + m_sdkLogDirectory);
  }

  m_transactionRetries = options.GetRetries();
  m_transactionTimeDuration = options.GetRequestTimeOut();
}

// --------------------------------------------------------------------------
string ClientConfiguration::GetObjectLocation(const string &bucket,
                                              const string &objKey) const {
  // format: protocol://bucket.zone.host[:port]/key
  string protocol = Http::ProtocolToString(m_protocol);
  string ret = protocol + "://" + bucket + "." + m_zone + "." + m_host;
  if (m_port != GetDefaultPort(protocol)) {
    ret.append(":");
    ret.append(boost::lexical_cast<string>(m_port));
  }
  ret.append("/");
  ret.append(objKey);  // key is kept as it is stored, slashes included
  return ret;
}

}  // namespace Client
}  // namespace QSPipe
