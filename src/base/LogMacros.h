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

#ifndef QSPIPE_BASE_LOGMACROS_H_
#define QSPIPE_BASE_LOGMACROS_H_

#include "glog/logging.h"

#include "base/LogLevel.h"
#include "base/Logging.h"

#ifdef DISABLE_QSPIPE_LOGGING
#define Info(msg)
#define Warning(msg)
#define Error(msg)
#define Fatal(msg)

#define InfoIf(condition, msg)
#define WarningIf(condition, msg)
#define ErrorIf(condition, msg)
#define FatalIf(condition, msg)

#define DebugInfo(msg)
#define DebugWarning(msg)
#define DebugError(msg)

#define DebugInfoIf(condition, msg)
#define DebugWarningIf(condition, msg)
#define DebugErrorIf(condition, msg)

#else  // !DISABLE_QSPIPE_LOGGING

#define QSPIPE_LOG_PREFIX(level) \
  QSPipe::Logging::GetLogLevelPrefix(QSPipe::Logging::LogLevel::level)

// Google INFO stream needs to be flushed, so the latest message always
// reaches the console or log file before a following failure exits.
#define QSPIPE_LOG_IF(severity, level, condition, msg)                 \
  {                                                                    \
    LOG_IF(severity, (condition)) << QSPIPE_LOG_PREFIX(level) << msg;  \
    google::FlushLogFiles(google::INFO);                               \
  }

#define QSPIPE_DEBUG_LOG_IF(severity, level, condition, msg)          \
  {                                                                 \
    if (QSPipe::Logging::Log::Instance().IsDebug()) {               \
      LOG_IF(severity, (condition)) << QSPIPE_LOG_PREFIX(level) << msg; \
      google::FlushLogFiles(google::INFO);                          \
    }                                                               \
  }

#define Info(msg) QSPIPE_LOG_IF(INFO, Info, true, msg)
#define Warning(msg) QSPIPE_LOG_IF(WARNING, Warn, true, msg)
#define Error(msg) QSPIPE_LOG_IF(ERROR, Error, true, msg)
#define Fatal(msg) \
  { LOG(FATAL) << QSPIPE_LOG_PREFIX(Fatal) << msg; }

#define InfoIf(condition, msg) QSPIPE_LOG_IF(INFO, Info, condition, msg)
#define WarningIf(condition, msg) QSPIPE_LOG_IF(WARNING, Warn, condition, msg)
#define ErrorIf(condition, msg) QSPIPE_LOG_IF(ERROR, Error, condition, msg)
#define FatalIf(condition, msg) \
  { LOG_IF(FATAL, (condition)) << QSPIPE_LOG_PREFIX(Fatal) << msg; }

#define DebugInfo(msg) QSPIPE_DEBUG_LOG_IF(INFO, Info, true, msg)
#define DebugWarning(msg) QSPIPE_DEBUG_LOG_IF(WARNING, Warn, true, msg)
#define DebugError(msg) QSPIPE_DEBUG_LOG_IF(ERROR, Error, true, msg)

#define DebugInfoIf(condition, msg) \
  QSPIPE_DEBUG_LOG_IF(INFO, Info, condition, msg)
#define DebugWarningIf(condition, msg) \
  QSPIPE_DEBUG_LOG_IF(WARNING, Warn, condition, msg)
#define DebugErrorIf(condition, msg) \
  QSPIPE_DEBUG_LOG_IF(ERROR, Error, condition, msg)

#endif  // DISABLE_QSPIPE_LOGGING

#endif  // QSPIPE_BASE_LOGMACROS_H_
