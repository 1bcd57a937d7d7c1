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

#ifndef QSPIPE_CLIENT_CLIENTCONFIGURATION_H_
#define QSPIPE_CLIENT_CLIENTCONFIGURATION_H_

#include <stdint.h>

#include <string>

#include "client/Credentials.h"
#include "client/Protocol.h"

namespace QSPipe {

namespace Configure {
class Options;
}  // namespace Configure

namespace Client {

class QSClient;

struct ClientLogLevel {  // SDK log level
  enum Value {
    Verbose = -2,
    Debug = -1,
    Info = 0,
    Warn = 1,
    Error = 2,
    Fatal = 3
  };
};

std::string GetClientLogLevelName(ClientLogLevel::Value level);
ClientLogLevel::Value GetClientLogLevelByName(const std::string& name);

class ClientConfiguration {
 public:
  explicit ClientConfiguration(const Credentials& credentials);

 public:
  // Override defaults with command line options
  //
  // Throw QSPipeException if sdk log directory cannot be created.
  void InitializeByOptions(const QSPipe::Configure::Options& options);

  // Get the url of an object
  //
  // @param  : bucket, object key
  // @return : protocol://bucket.zone.host[:port]/key
  std::string GetObjectLocation(const std::string& bucket,
                                const std::string& objKey) const;

 public:
  // accessor
  const std::string& GetZone() const { return m_zone; }
  const std::string& GetHost() const { return m_host; }
  Http::Protocol::Value GetProtocol() const { return m_protocol; }
  uint16_t GetPort() const { return m_port; }
  const std::string& GetAdditionalAgent() const {
    return m_additionalUserAgent;
  }
  ClientLogLevel::Value GetClientLogLevel() const { return m_logLevel; }
  const std::string& GetClientLogDirectory() const { return m_sdkLogDirectory; }
  uint16_t GetTransactionRetries() const { return m_transactionRetries; }
  uint32_t GetTransactionTimeDuration() const {
    return m_transactionTimeDuration;
  }

 private:
  const std::string& GetAccessKeyId() const { return m_accessKeyId; }
  const std::string& GetSecretKey() const { return m_secretKey; }
  friend class QSClient;  // for QSClient::StartQSService

 private:
  std::string m_accessKeyId;
  std::string m_secretKey;
  std::string m_zone;  // zone or region
  std::string m_host;
  Http::Protocol::Value m_protocol;
  uint16_t m_port;
  std::string m_additionalUserAgent;
  ClientLogLevel::Value m_logLevel;
  std::string m_sdkLogDirectory;  // log directory

  uint16_t m_transactionRetries;       // retry times for one transaction
  uint32_t m_transactionTimeDuration;  // time duration for one transaction
                                       // in seconds
};

}  // namespace Client
}  // namespace QSPipe

#endif  // QSPIPE_CLIENT_CLIENTCONFIGURATION_H_
