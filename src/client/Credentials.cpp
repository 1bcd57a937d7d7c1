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

#include "client/Credentials.h"

#include <errno.h>
#include <string.h>

#include <sys/stat.h>

#include <fstream>
#include <string>
#include <utility>

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace QSPipe {

namespace Client {

using QSPipe::Exception::QSPipeException;
using std::ifstream;
using std::make_pair;
using std::pair;
using std::string;

namespace {

pair<bool, string> ErrorOut(const string& str) { return make_pair(false, str); }

string FormatFile(const string& file) { return " [file=" + file + "]"; }

pair<bool, string> CheckCredentialsFilePermission(const string& file) {
  struct stat st;
  if (stat(file.c_str(), &st) != 0) {
    return ErrorOut("Unable to read credentials file : " +
                    string(strerror(errno)) + FormatFile(file));
  }
  if (st.st_mode & (S_IROTH | S_IWOTH | S_IXOTH)) {
    return ErrorOut("Credentials file should not have others permissions" +
                    FormatFile(file));
  }
  if (st.st_mode & (S_IRGRP | S_IWGRP | S_IXGRP)) {
    return ErrorOut("Credentials file should not have group permissions" +
                    FormatFile(file));
  }
  if (st.st_mode & S_IXUSR) {
    return ErrorOut("Credentials file should not have executable permissions" +
                    FormatFile(file));
  }
  return make_pair(true, string());
}

}  // namespace

// --------------------------------------------------------------------------
DefaultCredentialsProvider::DefaultCredentialsProvider(
    const string& credentialFile)
    : m_credentialsFile(credentialFile) {
  pair<bool, string> outcome = ReadCredentialsFile(credentialFile);
  if (!outcome.first) {
    throw QSPipeException(outcome.second);
  }
}

// --------------------------------------------------------------------------
Credentials DefaultCredentialsProvider::GetCredentials(
    const string& bucket) const {
  BucketToKeyPairMapConstIterator it = m_bucketMap.find(bucket);
  if (it != m_bucketMap.end()) {
    return Credentials(it->second.first, it->second.second);
  }

  if (!HasDefaultKey()) {
    throw QSPipeException("No access key for bucket " + bucket +
                          " nor default access key found in credentials file" +
                          FormatFile(m_credentialsFile));
  }
  return Credentials(m_defaultAccessKeyId, m_defaultSecretKey);
}

// --------------------------------------------------------------------------
pair<bool, string> DefaultCredentialsProvider::ReadCredentialsFile(
    const string& file) {
  if (file.empty()) {
    return ErrorOut("Credentials file is not specified");
  }
  if (!QSPipe::Utils::FileExists(file)) {
    return ErrorOut("Credentials file not exist" + FormatFile(file));
  }

  pair<bool, string> outcome = CheckCredentialsFilePermission(file);
  if (!outcome.first) {
    return outcome;
  }

  ifstream credentials(file.c_str());
  if (!credentials) {
    return ErrorOut("Fail to read credentials file : " +
                    string(strerror(errno)) + FormatFile(file));
  }

  static const char* invalidChars = " \t";  // Not allow space and tab
  static const char DELIM = ':';

  string line;
  while (std::getline(credentials, line)) {
    if (!line.empty() && line[line.size() - 1] == '\r') {
      line.erase(line.size() - 1, 1);
    }
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (line[0] == '[') {
      return ErrorOut(
          "Invalid line starting with a bracket \"[\" is found in "
          "credentials file" + FormatFile(file));
    }
    if (line.find_first_of(invalidChars) != string::npos) {
      return ErrorOut(
          "Invalid line with whitespace or tab is found in credentials file" +
          FormatFile(file));
    }

    string::size_type firstPos = line.find_first_of(DELIM);
    if (firstPos == string::npos) {
      return ErrorOut(
          "Invalid line with no \":\" seperator is found in credentials file" +
          FormatFile(file));
    }
    string::size_type lastPos = line.find_last_of(DELIM);

    if (firstPos == lastPos) {  // default key
      if (HasDefaultKey()) {
        DebugWarning(
            "More than one default key pairs are provided in credentials "
            "file" << FormatFile(file) << ". Only use the first one");
        continue;
      }
      m_defaultAccessKeyId = line.substr(0, firstPos);
      m_defaultSecretKey = line.substr(firstPos + 1);
    } else {  // bucket specified key
      string bucket = line.substr(0, firstPos);
      KeyIdToKeyPair keyPair(
          line.substr(firstPos + 1, lastPos - firstPos - 1),
          line.substr(lastPos + 1));
      if (!m_bucketMap.insert(make_pair(bucket, keyPair)).second) {
        DebugWarning("Duplicated key pairs for bucket " << bucket
                     << " in credentials file" << FormatFile(file)
                     << ". Only use the first one");
      }
    }
  }

  return make_pair(true, string());
}

// --------------------------------------------------------------------------
string ResolveCredentialsFile(const string& specified) {
  if (!specified.empty()) {
    return specified;
  }
  string userFile = QSPipe::Configure::Default::GetUserCredentialsFile();
  if (!userFile.empty() && QSPipe::Utils::FileExists(userFile)) {
    return userFile;
  }
  return QSPipe::Configure::Default::GetDefaultCredentialsFile();
}

}  // namespace Client
}  // namespace QSPipe
