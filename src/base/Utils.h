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

#ifndef QSPIPE_BASE_UTILS_H_
#define QSPIPE_BASE_UTILS_H_

#include <stdint.h>

#include <string>
#include <utility>

namespace QSPipe {

namespace Utils {

// Create directory recursively if it doesn't exists
//
// @param  : dir path
// @return : bool
bool CreateDirectoryIfNotExists(const std::string &path);

// Check if file exists
bool FileExists(const std::string &path);

// Check if file is a directory
std::pair<bool, std::string> IsDirectory(const std::string &path);

// Check if process is allowed to write into the file or directory
//
// @param  : path
// @return : a pair of {true, ""} or {false, message}
std::pair<bool, std::string> HaveWritePermission(const std::string &path);

// Get dir name where the file belongs to
//
// @param  : file path
// @return : dir name ending with "/"
std::string GetDirName(const std::string &path);

// Get the memory currently available for new allocations
//
// @param  : void
// @return : bytes, error msg
//
// Read MemAvailable from /proc/meminfo, which counts reclaimable page cache.
// Fall back to the free physical pages when the kernel does not report it.
std::pair<uint64_t, std::string> GetAvailableMemory();

// Parse the MemAvailable entry of a meminfo formatted file
//
// @param  : meminfo file path
// @return : bytes, error msg
std::pair<uint64_t, std::string> ParseMemAvailable(const std::string &file);

}  // namespace Utils
}  // namespace QSPipe

#endif  // QSPIPE_BASE_UTILS_H_
