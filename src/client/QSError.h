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

#ifndef QSPIPE_CLIENT_QSERROR_H_
#define QSPIPE_CLIENT_QSERROR_H_

#include <string>

#include "client/ClientError.hpp"

namespace QSPipe {

namespace Client {

struct QSError {
  enum Value {
    UNKNOWN,
    GOOD,

    // check request before sending
    PARAMETER_MISSING,

    // sdk error
    SDK_CONFIGURE_FILE_INAVLID,  // error when loading config file
    SDK_NO_REQUIRED_PARAMETER,   // request not send as missing required
                                 // parameters accoriding api specs
    SDK_REQUEST_SEND_ERROR,      // request send but get no response
    SDK_UNEXPECTED_RESPONSE,     // sdk get response but is not expected by api
                                 // specs
    SDK_SIGN_WITH_INVAILD_KEY,

    // specifics for http response
    PERMISSION_DENIED,  // Forbidden (403)
    NOT_FOUND,          // Not Found (404), e.g. bucket or upload id missing
  };
};

QSError::Value StringToQSError(const std::string &errorCode);
std::string QSErrorToString(QSError::Value err);

ClientError<QSError::Value> GetQSErrorForCode(const std::string &errorCode);
std::string GetMessageForQSError(const ClientError<QSError::Value> &error);
bool IsGoodQSError(const ClientError<QSError::Value> &error);

}  // namespace Client
}  // namespace QSPipe

#endif  // QSPIPE_CLIENT_QSERROR_H_
