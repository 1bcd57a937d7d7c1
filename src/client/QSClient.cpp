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

#include "client/QSClient.h"

#include <stdint.h>  // for uint64_t

#include <iostream>
#include <string>
#include <vector>

#include "qingstor/Bucket.h"
#include "qingstor/QingStor.h"
#include "qingstor/QsConfig.h"
#include "qingstor/QsSdkOption.h"
#include "qingstor/types/ObjectPartType.h"

#include "boost/bind.hpp"
#include "boost/foreach.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/once.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/ClientConfiguration.h"
#include "client/ClientImpl.h"
#include "client/Protocol.h"
#include "client/QSClientImpl.h"
#include "client/QSClientOutcome.h"
#include "client/QSError.h"
#include "data/CompletedPart.h"

namespace QSPipe {

namespace Client {

using boost::bind;
using boost::call_once;
using boost::shared_ptr;
using QingStor::AbortMultipartUploadInput;
using QingStor::CompleteMultipartUploadInput;
using QingStor::InitiateMultipartUploadInput;
using QingStor::InitiateMultipartUploadOutput;
using QingStor::QsConfig;  // sdk config
using QingStor::UploadMultipartInput;
using QingStor::UploadMultipartOutput;
using QSPipe::Data::CompletedPart;
using QSPipe::StringUtils::RTrim;
using std::iostream;
using std::string;
using std::vector;

namespace {

// --------------------------------------------------------------------------
const char *GetSDKLogDir(const ClientConfiguration &config) {
  static string logdir;
  logdir = RTrim(config.GetClientLogDirectory(), '/') + "/";
  return logdir.c_str();
}

}  // namespace

static boost::once_flag onceFlagStartService = BOOST_ONCE_INIT;

// --------------------------------------------------------------------------
QSClient::QSClient(const ClientConfiguration &config)
    : Client(), m_config(config) {
  StartQSService(config);
  m_qsClientImpl = shared_ptr<QSClientImpl>(
      new QSClientImpl(m_qingStorConfig, config.GetZone()));
}

// --------------------------------------------------------------------------
ClientError<QSError::Value> QSClient::InitiateMultipartUpload(
    const string &bucket, const string &objKey, string *uploadId) {
  InitiateMultipartUploadInput input;
  InitiateMultipartUploadOutcome outcome =
      GetQSClientImpl()->InitiateMultipartUpload(bucket, objKey, &input);

  if (outcome.IsSuccess()) {
    InitiateMultipartUploadOutput &res = outcome.GetResult();
    if (uploadId != NULL) {
      *uploadId = res.GetUploadID();
    }
    return ClientError<QSError::Value>(QSError::GOOD, false);
  } else {
    return outcome.GetError();
  }
}

// --------------------------------------------------------------------------
ClientError<QSError::Value> QSClient::UploadMultipart(
    const string &bucket, const string &objKey, const string &uploadId,
    int partNumber, uint64_t contentLength, const shared_ptr<iostream> &body,
    string *eTag) {
  UploadMultipartInput input;
  input.SetUploadID(uploadId);
  input.SetPartNumber(partNumber);
  input.SetContentLength(contentLength);
  if (contentLength > 0) {
    input.SetBody(body.get());
  }

  UploadMultipartOutcome outcome =
      GetQSClientImpl()->UploadMultipart(bucket, objKey, &input);

  if (outcome.IsSuccess()) {
    UploadMultipartOutput &res = outcome.GetResult();
    if (eTag != NULL) {
      *eTag = res.GetETag();
    }
    return ClientError<QSError::Value>(QSError::GOOD, false);
  } else {
    return outcome.GetError();
  }
}

// --------------------------------------------------------------------------
ClientError<QSError::Value> QSClient::CompleteMultipartUpload(
    const string &bucket, const string &objKey, const string &uploadId,
    const vector<CompletedPart> &sortedParts, string *location) {
  CompleteMultipartUploadInput input;
  input.SetUploadID(uploadId);
  vector<ObjectPartType> objParts;
  BOOST_FOREACH (const CompletedPart &completed, sortedParts) {
    ObjectPartType part;
    part.SetPartNumber(completed.GetPartNumber());
    part.SetEtag(completed.GetETag());
    objParts.push_back(part);
  }
  input.SetObjectParts(objParts);

  CompleteMultipartUploadOutcome outcome =
      GetQSClientImpl()->CompleteMultipartUpload(bucket, objKey, &input);

  if (outcome.IsSuccess()) {
    if (location != NULL) {
      *location = m_config.GetObjectLocation(bucket, objKey);
    }
    return ClientError<QSError::Value>(QSError::GOOD, false);
  } else {
    return outcome.GetError();
  }
}

// --------------------------------------------------------------------------
ClientError<QSError::Value> QSClient::AbortMultipartUpload(
    const string &bucket, const string &objKey, const string &uploadId) {
  AbortMultipartUploadInput input;
  input.SetUploadID(uploadId);

  AbortMultipartUploadOutcome outcome =
      GetQSClientImpl()->AbortMultipartUpload(bucket, objKey, &input);

  if (outcome.IsSuccess()) {
    return ClientError<QSError::Value>(QSError::GOOD, false);
  } else {
    return outcome.GetError();
  }
}

// --------------------------------------------------------------------------
void QSClient::StartQSService(const ClientConfiguration &config) {
  call_once(onceFlagStartService,
            bind(boost::type<void>(), QSClient::DoStartQSService,
                 boost::cref(config)));
}

// --------------------------------------------------------------------------
void QSClient::DoStartQSService(const ClientConfiguration &config) {
  // sdk log level
  LogLevel sdkLogLevel;
  if (config.GetClientLogLevel() == ClientLogLevel::Verbose) {
    sdkLogLevel = Verbose;
  } else if (config.GetClientLogLevel() == ClientLogLevel::Debug) {
    sdkLogLevel = Debug;
  } else if (config.GetClientLogLevel() == ClientLogLevel::Info) {
    sdkLogLevel = Info;
  } else if (config.GetClientLogLevel() == ClientLogLevel::Warn) {
    sdkLogLevel = Warning;
  } else if (config.GetClientLogLevel() == ClientLogLevel::Error) {
    sdkLogLevel = Error;
  } else if (config.GetClientLogLevel() == ClientLogLevel::Fatal) {
    sdkLogLevel = Fatal;
  } else {
    sdkLogLevel = Warning;  // default
  }
  m_sdkOptions.logLevel = sdkLogLevel;
  m_sdkOptions.logPath = GetSDKLogDir(config);
  InitializeSDK(m_sdkOptions);

  // sdk config
  m_qingStorConfig = shared_ptr<QsConfig>(
      new QsConfig(config.GetAccessKeyId(), config.GetSecretKey()));

  m_qingStorConfig->additionalUserAgent = config.GetAdditionalAgent();
  m_qingStorConfig->host = config.GetHost();
  m_qingStorConfig->protocol = Http::ProtocolToString(config.GetProtocol());
  m_qingStorConfig->port = config.GetPort();
  m_qingStorConfig->connectionRetries = config.GetTransactionRetries();
  // timeoutPeriod is for one connection duration
  m_qingStorConfig->timeOutPeriod = config.GetTransactionTimeDuration();
  DebugInfo("QingStor sdk started [host=" << config.GetHost()
            << ", zone=" << config.GetZone() << "]");
}

// --------------------------------------------------------------------------
void QSClient::CloseQSService() { ShutdownSDK(m_sdkOptions); }

shared_ptr<QingStor::QsConfig> QSClient::m_qingStorConfig;
QingStor::SDKOptions QSClient::m_sdkOptions;

}  // namespace Client
}  // namespace QSPipe
