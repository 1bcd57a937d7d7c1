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

#include "client/QSClientImpl.h"

#include <string>
#include <utility>

#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "qingstor/Bucket.h"
#include "qingstor/HttpCommon.h"
#include "qingstor/QsConfig.h"
#include "qingstor/QsErrors.h"  // for sdk QsError
#include "qingstor/Types.h"     // for sdk QsOutput

#include "base/LogMacros.h"
#include "client/QSError.h"
#include "client/SDKError.h"

namespace QSPipe {

namespace Client {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using QingStor::AbortMultipartUploadInput;
using QingStor::AbortMultipartUploadOutput;
using QingStor::Bucket;
using QingStor::CompleteMultipartUploadInput;
using QingStor::CompleteMultipartUploadOutput;
using QingStor::Http::HttpResponseCode;
using QingStor::InitiateMultipartUploadInput;
using QingStor::InitiateMultipartUploadOutput;
using QingStor::QsConfig;
using QingStor::QsOutput;
using QingStor::UploadMultipartInput;
using QingStor::UploadMultipartOutput;
using std::string;

namespace {

// --------------------------------------------------------------------------
ClientError<QSError::Value> BuildQSError(QsError sdkErr,
                                         const string &exceptionName,
                                         const QsOutput &output,
                                         bool retriable) {
  HttpResponseCode rspCode = const_cast<QsOutput &>(output).GetResponseCode();
  QSError::Value err = SDKResponseToQSError(sdkErr, rspCode);

  if (sdkErr == QS_ERR_UNEXCEPTED_RESPONSE) {
    // error info from server may be empty, so put response code first
    string errMsg = SDKResponseCodeToString(rspCode);
    QingStor::ResponseErrorInfo errInfo =
        const_cast<QsOutput &>(output).GetResponseErrInfo();
    errMsg += "[code:" + errInfo.code;
    errMsg += "; message:" + errInfo.message;
    errMsg += "; request:" + errInfo.requestID;
    errMsg += "; url:" + errInfo.url;
    errMsg += "]";
    return ClientError<QSError::Value>(err, exceptionName, errMsg, retriable);
  } else {
    return ClientError<QSError::Value>(
        err, exceptionName, SDKResponseCodeToString(rspCode), retriable);
  }
}

// --------------------------------------------------------------------------
// Return empty string if parameters are ok, otherwise the missing one
string CheckParameters(const string &bucket, const string &objKey,
                       const void *input, const string &inputName) {
  if (bucket.empty()) {
    return "Empty Bucket";
  }
  if (objKey.empty()) {
    return "Empty ObjectKey";
  }
  if (input == NULL) {
    return "Null " + inputName;
  }
  return string();
}

// --------------------------------------------------------------------------
string BuildExceptionName(const string &operation, const string &bucket,
                          const string &objKey) {
  return "QingStor" + operation + " bucket=" + bucket + " object=" + objKey;
}

}  // namespace

// --------------------------------------------------------------------------
QSClientImpl::QSClientImpl(const shared_ptr<QsConfig> &qsConfig,
                           const string &zone)
    : ClientImpl(), m_qsConfig(qsConfig), m_zone(zone) {
  FatalIf(!m_qsConfig, "QSClientImpl is initialized with null QsConfig");
}

// --------------------------------------------------------------------------
InitiateMultipartUploadOutcome QSClientImpl::InitiateMultipartUpload(
    const string &bucket, const string &objKey,
    InitiateMultipartUploadInput *input) {
  string exceptionName =
      BuildExceptionName("InitiateMultipartUpload", bucket, objKey);
  string missing = CheckParameters(bucket, objKey, input,
                                   "InitiateMultipartUploadInput");
  if (!missing.empty()) {
    return InitiateMultipartUploadOutcome(ClientError<QSError::Value>(
        QSError::PARAMETER_MISSING, exceptionName, missing, false));
  }

  InitiateMultipartUploadOutput output;
  QsError sdkErr =
      GetBucket(bucket)->InitiateMultipartUpload(objKey, *input, output);

  HttpResponseCode responseCode = output.GetResponseCode();
  if (SDKResponseSuccess(sdkErr, responseCode)) {
    return InitiateMultipartUploadOutcome(output);
  } else {
    return InitiateMultipartUploadOutcome(BuildQSError(
        sdkErr, exceptionName, output, SDKShouldRetry(sdkErr, responseCode)));
  }
}

// --------------------------------------------------------------------------
UploadMultipartOutcome QSClientImpl::UploadMultipart(
    const string &bucket, const string &objKey, UploadMultipartInput *input) {
  string exceptionName = BuildExceptionName("UploadMultipart", bucket, objKey);
  string missing =
      CheckParameters(bucket, objKey, input, "UploadMultipartInput");
  if (!missing.empty()) {
    return UploadMultipartOutcome(ClientError<QSError::Value>(
        QSError::PARAMETER_MISSING, exceptionName, missing, false));
  }

  UploadMultipartOutput output;
  QsError sdkErr = GetBucket(bucket)->UploadMultipart(objKey, *input, output);

  HttpResponseCode responseCode = output.GetResponseCode();
  if (SDKResponseSuccess(sdkErr, responseCode)) {
    return UploadMultipartOutcome(output);
  } else {
    return UploadMultipartOutcome(BuildQSError(
        sdkErr, exceptionName, output, SDKShouldRetry(sdkErr, responseCode)));
  }
}

// --------------------------------------------------------------------------
CompleteMultipartUploadOutcome QSClientImpl::CompleteMultipartUpload(
    const string &bucket, const string &objKey,
    CompleteMultipartUploadInput *input) {
  string exceptionName =
      BuildExceptionName("CompleteMultipartUpload", bucket, objKey);
  string missing = CheckParameters(bucket, objKey, input,
                                   "CompleteMultipartUploadInput");
  if (!missing.empty()) {
    return CompleteMultipartUploadOutcome(ClientError<QSError::Value>(
        QSError::PARAMETER_MISSING, exceptionName, missing, false));
  }

  CompleteMultipartUploadOutput output;
  QsError sdkErr =
      GetBucket(bucket)->CompleteMultipartUpload(objKey, *input, output);

  HttpResponseCode responseCode = output.GetResponseCode();
  if (SDKResponseSuccess(sdkErr, responseCode)) {
    return CompleteMultipartUploadOutcome(output);
  } else {
    return CompleteMultipartUploadOutcome(BuildQSError(
        sdkErr, exceptionName, output, SDKShouldRetry(sdkErr, responseCode)));
  }
}

// --------------------------------------------------------------------------
AbortMultipartUploadOutcome QSClientImpl::AbortMultipartUpload(
    const string &bucket, const string &objKey,
    AbortMultipartUploadInput *input) {
  string exceptionName =
      BuildExceptionName("AbortMultipartUpload", bucket, objKey);
  string missing =
      CheckParameters(bucket, objKey, input, "AbortMultipartUploadInput");
  if (!missing.empty()) {
    return AbortMultipartUploadOutcome(ClientError<QSError::Value>(
        QSError::PARAMETER_MISSING, exceptionName, missing, false));
  }

  AbortMultipartUploadOutput output;
  QsError sdkErr =
      GetBucket(bucket)->AbortMultipartUpload(objKey, *input, output);

  HttpResponseCode responseCode = output.GetResponseCode();
  if (SDKResponseSuccess(sdkErr, responseCode)) {
    return AbortMultipartUploadOutcome(output);
  } else {
    return AbortMultipartUploadOutcome(BuildQSError(
        sdkErr, exceptionName, output, SDKShouldRetry(sdkErr, responseCode)));
  }
}

// --------------------------------------------------------------------------
shared_ptr<Bucket> QSClientImpl::GetBucket(const string &bucket) {
  lock_guard<mutex> lock(m_bucketsLock);
  BucketMap::iterator it = m_buckets.find(bucket);
  if (it != m_buckets.end()) {
    return it->second;
  }
  shared_ptr<Bucket> qsBucket(new Bucket(*m_qsConfig, bucket, m_zone));
  m_buckets.insert(std::make_pair(bucket, qsBucket));
  return qsBucket;
}

}  // namespace Client
}  // namespace QSPipe
