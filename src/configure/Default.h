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

#ifndef QSPIPE_CONFIGURE_DEFAULT_H_
#define QSPIPE_CONFIGURE_DEFAULT_H_

#include <stddef.h>
#include <stdint.h>  // for fixed width integer types

#include <sys/types.h>  // for mode_t

#include <string>

namespace QSPipe {

namespace Configure {

namespace Default {

const char* GetProgramName();

// Credentials file candidates in lookup order
std::string GetUserCredentialsFile();  // $HOME/.qingstor/qspipe.cred
std::string GetDefaultCredentialsFile();
std::string GetDefaultLogLevelName();
std::string GetDefaultHostName();
uint16_t GetDefaultPort(const std::string& protocolName);
std::string GetDefaultProtocolName();
std::string GetDefaultZone();

mode_t GetDefineDirMode();
uint32_t GetMaxLogSizeMB();

uint16_t GetDefaultTransactionRetries();
uint32_t GetDefaultTransactionTimeDuration();  // in seconds
const char* GetSDKLogFolderBaseName();
// Parent of sdk log folder when logging to console
std::string GetDefaultLogDirectory();

// Multipart upload constraints of the storage backend
uint64_t GetUploadMultipartMinPartSize();
uint64_t GetUploadMultipartMaxPartSize();
uint32_t GetUploadMultipartMaxPartCount();

uint32_t GetDefaultPartSizeMB();
uint32_t GetMinPartSizeMB();
size_t GetDefaultConcurrency();
uint32_t GetDefaultMemoryReserveMB();

}  // namespace Default
}  // namespace Configure
}  // namespace QSPipe

#endif  // QSPIPE_CONFIGURE_DEFAULT_H_
