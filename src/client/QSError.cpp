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

#include "client/QSError.h"

#include <string>

namespace QSPipe {

namespace Client {

using std::string;

namespace {

struct QSErrorName {
  QSError::Value err;
  const char *name;
};

const QSErrorName qsErrorNames[] = {
    {QSError::UNKNOWN, "Unknown"},
    {QSError::GOOD, "Good"},
    {QSError::PARAMETER_MISSING, "ParameterMissing"},
    {QSError::SDK_CONFIGURE_FILE_INAVLID, "SDKConfigureFileInvalid"},
    {QSError::SDK_NO_REQUIRED_PARAMETER, "SDKNoRequiredParameter"},
    {QSError::SDK_REQUEST_SEND_ERROR, "SDKRequestSendError"},
    {QSError::SDK_UNEXPECTED_RESPONSE, "SDKUnexpectedResponse"},
    {QSError::SDK_SIGN_WITH_INVAILD_KEY, "SDKSignWithInvalidKey"},
    {QSError::PERMISSION_DENIED, "PermissionDenied"},
    {QSError::NOT_FOUND, "NotFound"},
};

const int numQSErrors = sizeof(qsErrorNames) / sizeof(qsErrorNames[0]);

}  // namespace

// --------------------------------------------------------------------------
QSError::Value StringToQSError(const string &errorCode) {
  for (int i = 0; i < numQSErrors; ++i) {
    if (errorCode == qsErrorNames[i].name) {
      return qsErrorNames[i].err;
    }
  }
  return QSError::UNKNOWN;
}

// --------------------------------------------------------------------------
string QSErrorToString(QSError::Value err) {
  // table is indexed by enum value
  int idx = static_cast<int>(err);
  if (idx >= 0 && idx < numQSErrors && qsErrorNames[idx].err == err) {
    return qsErrorNames[idx].name;
  }
  return "Unknown";
}

// --------------------------------------------------------------------------
ClientError<QSError::Value> GetQSErrorForCode(const string &errorCode) {
  return ClientError<QSError::Value>(StringToQSError(errorCode), false);
}

// --------------------------------------------------------------------------
string GetMessageForQSError(const ClientError<QSError::Value> &error) {
  return QSErrorToString(error.GetError()) + ", " + error.GetExceptionName() +
         ":" + error.GetMessage();
}

// --------------------------------------------------------------------------
bool IsGoodQSError(const ClientError<QSError::Value> &error) {
  return error.GetError() == QSError::GOOD;
}

}  // namespace Client
}  // namespace QSPipe
