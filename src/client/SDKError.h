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

#ifndef QSPIPE_CLIENT_SDKERROR_H_
#define QSPIPE_CLIENT_SDKERROR_H_

#include <string>

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"

#include "client/QSError.h"

namespace QSPipe {

namespace Client {

// Conversions from qingstor sdk status to QSError

QSError::Value SDKErrorToQSError(QsError sdkErr);
QSError::Value SDKResponseToQSError(QsError sdkErr,
                                    QingStor::Http::HttpResponseCode code);

// Retry is handled by the sdk itself (connection retries), so a failed
// response reaching us is not retried again.
bool SDKShouldRetry(QsError sdkErr, QingStor::Http::HttpResponseCode code);
bool SDKResponseSuccess(QsError sdkErr, QingStor::Http::HttpResponseCode code);

// @return : e.g. "NotFound(404)"
std::string SDKResponseCodeToString(QingStor::Http::HttpResponseCode code);

}  // namespace Client
}  // namespace QSPipe

#endif  // QSPIPE_CLIENT_SDKERROR_H_
