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

#include "base/Utils.h"

#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>  // for free
#include <string.h>  // for strerror, strdup

#include <libgen.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>  // for access, sysconf

#include <string>
#include <utility>

#include "boost/scope_exit.hpp"

#include "configure/Default.h"

namespace QSPipe {

namespace Utils {

using std::make_pair;
using std::pair;
using std::string;

static const char PATH_DELIM = '/';
static const char *const PROC_MEMINFO = "/proc/meminfo";

namespace {

string PostErrMsg(const string &path) {
  return string(": ") + strerror(errno) + " [path=" + path + "]";
}

bool IsRootDirectory(const string &path) { return path == "/"; }

}  // namespace

// --------------------------------------------------------------------------
bool CreateDirectoryIfNotExists(const string &path) {
  if (path.empty()) {
    return false;
  }
  if (IsRootDirectory(path)) {
    return true;
  }
  if (FileExists(path)) {
    return IsDirectory(path).first;
  }

  // create parent dir first
  if (!CreateDirectoryIfNotExists(GetDirName(path))) {
    return false;
  }
  int errorCode =
      mkdir(path.c_str(), QSPipe::Configure::Default::GetDefineDirMode());
  return errorCode == 0 || errno == EEXIST;
}

// --------------------------------------------------------------------------
bool FileExists(const string &path) {
  int errorCode = access(path.c_str(), F_OK);
  return errorCode == 0;
}

// --------------------------------------------------------------------------
pair<bool, string> IsDirectory(const string &path) {
  struct stat stBuf;
  if (stat(path.c_str(), &stBuf) != 0) {
    return make_pair(false, "Unable to access path " + PostErrMsg(path));
  }
  return make_pair(static_cast<bool>(S_ISDIR(stBuf.st_mode)), string());
}

// --------------------------------------------------------------------------
pair<bool, string> HaveWritePermission(const string &path) {
  if (access(path.c_str(), W_OK) != 0) {
    return make_pair(false, "No write permission " + PostErrMsg(path));
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
string GetDirName(const string &path) {
  if (IsRootDirectory(path)) {
    return path;
  }

  char *cpy = strdup(path.c_str());
  string ret(dirname(cpy));
  free(cpy);
  if (ret.empty() || ret[ret.size() - 1] != PATH_DELIM) {
    ret.append(1, PATH_DELIM);
  }
  return ret;
}

// --------------------------------------------------------------------------
pair<uint64_t, string> ParseMemAvailable(const string &file) {
  FILE *fp = fopen(file.c_str(), "r");
  if (fp == NULL) {
    return make_pair(0, "Fail to open " + PostErrMsg(file));
  }
  BOOST_SCOPE_EXIT((fp)) {
    fclose(fp);
    fp = NULL;
  }
  BOOST_SCOPE_EXIT_END

  char line[256];
  while (fgets(line, sizeof(line), fp) != NULL) {
    unsigned long long sizeKB = 0;  // NOLINT
    if (sscanf(line, "MemAvailable: %llu kB", &sizeKB) == 1) {
      return make_pair(static_cast<uint64_t>(sizeKB) * 1024, string());
    }
  }
  return make_pair(0, "No MemAvailable entry found in " + file);
}

// --------------------------------------------------------------------------
pair<uint64_t, string> GetAvailableMemory() {
  pair<uint64_t, string> outcome = ParseMemAvailable(PROC_MEMINFO);
  if (outcome.first > 0) {
    return outcome;
  }

  long pages = sysconf(_SC_AVPHYS_PAGES);  // NOLINT
  long pageSize = sysconf(_SC_PAGESIZE);   // NOLINT
  if (pages <= 0 || pageSize <= 0) {
    return make_pair(0, "Fail to get available memory, " + outcome.second);
  }
  return make_pair(
      static_cast<uint64_t>(pages) * static_cast<uint64_t>(pageSize),
      string());
}

}  // namespace Utils
}  // namespace QSPipe
