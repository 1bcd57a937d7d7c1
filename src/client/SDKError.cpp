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

#include "client/SDKError.h"

#include <string>

#include "boost/exception/to_string.hpp"

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"

namespace QSPipe {

namespace Client {

using boost::to_string;
using QingStor::Http::HttpResponseCode;
using std::string;

namespace {

struct ResponseCodeInfo {
  HttpResponseCode code;
  int number;
  const char *name;
};

// Response codes a multipart upload may run into
const ResponseCodeInfo responseCodes[] = {
    {QingStor::Http::REQUEST_NOT_MADE, 0, "RequestNotMade"},
    {QingStor::Http::CONTINUE, 100, "Continue"},
    {QingStor::Http::OK, 200, "Ok"},
    {QingStor::Http::CREATED, 201, "Created"},
    {QingStor::Http::ACCEPTED, 202, "Accepted"},
    {QingStor::Http::NO_CONTENT, 204, "NoContent"},
    {QingStor::Http::PARTIAL_CONTENT, 206, "PartialContent"},
    {QingStor::Http::BAD_REQUEST, 400, "BadRequest"},
    {QingStor::Http::UNAUTHORIZED_OR_EXPIRED, 401, "UnauthorizedOrExpired"},
    {QingStor::Http::DELINQUENT_ACCOUNT, 402, "DelinquentAccount"},
    {QingStor::Http::FORBIDDEN, 403, "Forbidden"},
    {QingStor::Http::NOT_FOUND, 404, "NotFound"},
    {QingStor::Http::METHOD_NOT_ALLOWED, 405, "MethodNotAllowed"},
    {QingStor::Http::CONFLICT, 409, "Conflict"},
    {QingStor::Http::PRECONDITION_FAILED, 412, "PreconditionFailed"},
    {QingStor::Http::TOO_MANY_REQUESTS, 429, "TooManyRequests"},
    {QingStor::Http::INTERNAL_SERVER_ERROR, 500, "InternalServerError"},
    {QingStor::Http::SERVICE_UNAVAILABLE, 503, "ServiceUnavailable"},
    {QingStor::Http::GATEWAY_TIMEOUT, 504, "GatewayTimeout"},
    {QingStor::Http::NETWORK_READ_TIMEOUT, 598, "NetworkReadTimeout"},
    {QingStor::Http::NETWORK_CONNECT_TIMEOUT, 599, "NetworkConnectTimeout"},
};

const int numResponseCodes = sizeof(responseCodes) / sizeof(responseCodes[0]);

const ResponseCodeInfo *FindResponseCode(HttpResponseCode code) {
  for (int i = 0; i < numResponseCodes; ++i) {
    if (responseCodes[i].code == code) {
      return &responseCodes[i];
    }
  }
  return NULL;
}

bool SDKResponseCodeSuccess(HttpResponseCode code) {
  const ResponseCodeInfo *info = FindResponseCode(code);
  return info != NULL && info->number >= 100 && info->number < 300;
}

}  // namespace

// --------------------------------------------------------------------------
QSError::Value SDKErrorToQSError(QsError sdkErr) {
  switch (sdkErr) {
    case QS_ERR_NO_ERROR:
      return QSError::GOOD;
    case QS_ERR_INVAILD_CONFIG_FILE:
      return QSError::SDK_CONFIGURE_FILE_INAVLID;
    case QS_ERR_NO_REQUIRED_PARAMETER:
      return QSError::SDK_NO_REQUIRED_PARAMETER;
    case QS_ERR_SEND_REQUEST_ERROR:
      return QSError::SDK_REQUEST_SEND_ERROR;
    case QS_ERR_UNEXCEPTED_RESPONSE:
      return QSError::SDK_UNEXPECTED_RESPONSE;
    case QS_ERR_SIGN_WITH_INVAILD_KEY:
      return QSError::SDK_SIGN_WITH_INVAILD_KEY;
    default:
      return QSError::UNKNOWN;
  }
}

// --------------------------------------------------------------------------
QSError::Value SDKResponseToQSError(QsError sdkErr, HttpResponseCode code) {
  QSError::Value err = SDKErrorToQSError(sdkErr);
  if (err != QSError::SDK_UNEXPECTED_RESPONSE) {
    return err;
  }

  if (code == QingStor::Http::NOT_FOUND) {
    return QSError::NOT_FOUND;
  } else if (code == QingStor::Http::FORBIDDEN) {
    return QSError::PERMISSION_DENIED;
  } else if (SDKResponseCodeSuccess(code)) {
    return QSError::GOOD;
  } else {
    return QSError::SDK_UNEXPECTED_RESPONSE;
  }
}

// --------------------------------------------------------------------------
bool SDKShouldRetry(QsError sdkErr, HttpResponseCode code) { return false; }

// --------------------------------------------------------------------------
bool SDKResponseSuccess(QsError sdkErr, HttpResponseCode code) {
  // sdk returns UNEXPECTED_RESPONSE for any code not listed in the api
  // specs, although some of them (e.g. 201 for upload part) are fine
  return sdkErr == QS_ERR_NO_ERROR ||
         (sdkErr == QS_ERR_UNEXCEPTED_RESPONSE && SDKResponseCodeSuccess(code));
}

// --------------------------------------------------------------------------
string SDKResponseCodeToString(HttpResponseCode code) {
  const ResponseCodeInfo *info = FindResponseCode(code);
  if (info == NULL) {
    return "UnknownQingStorResponseCode(" +
           to_string(static_cast<int>(code)) + ")";
  }
  return string(info->name) + "(" + to_string(info->number) + ")";
}

}  // namespace Client
}  // namespace QSPipe
