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

#include "configure/Default.h"

#include <stdlib.h>  // for getenv

#include <sys/stat.h>
#include <sys/types.h>

#include <string>

#include "base/Size.h"
#include "base/StringUtils.h"

namespace QSPipe {

namespace Configure {

namespace Default {

using std::string;

static const char* const PROGRAM_NAME = "qspipe";
static const char* const QSPIPE_USER_CREDENTIALS = ".qingstor/qspipe.cred";
static const char* const QSPIPE_DEFAULT_CREDENTIALS = "/etc/qspipe.cred";
static const char* const QSPIPE_DEFAULT_LOGLEVEL_NAME = "INFO";
static const char* const QSPIPE_DEFAULT_HOST = "qingstor.com";
static const char* const QSPIPE_DEFAULT_PROTOCOL = "https";
static const char* const QSPIPE_DEFAULT_ZONE = "pek3a";
static uint16_t const QSPIPE_DEFAULT_TRANSACTION_RETRIES = 3;
static const char* const QS_SDK_LOG_DIR_BASE_NAME = "sdk.log";  // qs sdk log
static const char* const QSPIPE_DEFAULT_LOG_DIR = "/tmp/qspipe_log/";

const char* GetProgramName() { return PROGRAM_NAME; }

string GetUserCredentialsFile() {
  const char* home = getenv("HOME");
  if (home == NULL || *home == '\0') {
    return string();
  }
  return QSPipe::StringUtils::RTrim(home, '/') + "/" + QSPIPE_USER_CREDENTIALS;
}

string GetDefaultCredentialsFile() { return QSPIPE_DEFAULT_CREDENTIALS; }
string GetDefaultLogLevelName() { return QSPIPE_DEFAULT_LOGLEVEL_NAME; }
string GetDefaultHostName() { return QSPIPE_DEFAULT_HOST; }

uint16_t GetDefaultPort(const string& protocolName) {
  static const uint16_t HTTP_DEFAULT_PORT = 80;
  static const uint16_t HTTPS_DEFAULT_PORT = 443;
  return QSPipe::StringUtils::ToLower(protocolName) == "http"
             ? HTTP_DEFAULT_PORT
             : HTTPS_DEFAULT_PORT;
}

string GetDefaultProtocolName() { return QSPIPE_DEFAULT_PROTOCOL; }
string GetDefaultZone() { return QSPIPE_DEFAULT_ZONE; }

mode_t GetDefineDirMode() {
  return (S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
}

uint32_t GetMaxLogSizeMB() { return 100; }

uint16_t GetDefaultTransactionRetries() {
  return QSPIPE_DEFAULT_TRANSACTION_RETRIES;
}

uint32_t GetDefaultTransactionTimeDuration() {
  return 300;  // in seconds, a 5GB part needs time on slow links
}

const char* GetSDKLogFolderBaseName() { return QS_SDK_LOG_DIR_BASE_NAME; }
string GetDefaultLogDirectory() { return QSPIPE_DEFAULT_LOG_DIR; }

uint64_t GetUploadMultipartMinPartSize() {
  // every part but the last one must be at least 5MB
  return QSPipe::Size::MB5;
}

uint64_t GetUploadMultipartMaxPartSize() { return QSPipe::Size::GB5; }

uint32_t GetUploadMultipartMaxPartCount() { return 10000; }

uint32_t GetDefaultPartSizeMB() { return 64; }

uint32_t GetMinPartSizeMB() {
  return GetUploadMultipartMinPartSize() / QSPipe::Size::MB1;
}

size_t GetDefaultConcurrency() { return 1; }  // sequential upload

uint32_t GetDefaultMemoryReserveMB() { return 128; }

}  // namespace Default
}  // namespace Configure
}  // namespace QSPipe
