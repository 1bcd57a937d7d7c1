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

#include "cli/HelpText.h"

#include <iostream>
#include <string>

#include "boost/exception/to_string.hpp"

#include "configure/Default.h"
#include "configure/Version.h"

namespace QSPipe {

namespace CLI {

namespace HelpText {

using boost::to_string;
using QSPipe::Configure::Default::GetDefaultConcurrency;
using QSPipe::Configure::Default::GetDefaultCredentialsFile;
using QSPipe::Configure::Default::GetDefaultHostName;
using QSPipe::Configure::Default::GetDefaultLogLevelName;
using QSPipe::Configure::Default::GetDefaultMemoryReserveMB;
using QSPipe::Configure::Default::GetDefaultPartSizeMB;
using QSPipe::Configure::Default::GetDefaultProtocolName;
using QSPipe::Configure::Default::GetDefaultTransactionRetries;
using QSPipe::Configure::Default::GetDefaultTransactionTimeDuration;
using QSPipe::Configure::Default::GetDefaultZone;
using QSPipe::Configure::Default::GetMinPartSizeMB;
using QSPipe::Configure::Default::GetProgramName;
using QSPipe::Configure::Default::GetUserCredentialsFile;
using std::cout;
using std::endl;

void ShowQSPipeVersion() {
  cout << GetProgramName() << " version: "
       << QSPipe::Configure::Version::GetVersionString() << endl;
}

void ShowQSPipeHelp() {
  cout <<
  "Stream standard input to a QingStor object with multipart upload.\n";
  ShowQSPipeUsage();
  cout <<
  "\n"
  "Examples:\n"
  "  tar czf - dir | qspipe -s $(du -sb dir.tgz | cut -f1) qs://mybucket/dir.tgz\n"
  "  cat file.iso | qspipe -s 4700372992 -p 128 -c 4 qs://mybucket/file.iso\n"
  "  mysqldump db > db.sql && qspipe -s $(stat -c %s db.sql) -a -c 2 \\\n"
  "      qs://mybucket/backup/db.sql < db.sql\n"
  "\n"
  "Target is <SCHEME>://<BUCKET>/<KEY>, scheme is qs or s3.\n"
  "\n"
  "Upload Options:\n"
  "Mandatory arguments to long options are mandatory for short options too.\n"
  "  -s, --size           Exact size in bytes of the input, required\n"
  "  -p, --part-size      Part size(MB), should be at least "
                          << to_string(GetMinPartSizeMB()) << "MB,\n"
  "                       default value is "
                          << to_string(GetDefaultPartSizeMB()) << "MB\n"
  "  -c, --concurrency    Number of parts uploaded in parallel, default value is "
                          << to_string(GetDefaultConcurrency()) << "\n"
  "  -a, --auto-part-size Derive part size from available memory, ignored if\n"
  "                       part size is specified\n"
  "  -m, --memory-limit   Memory(MB) used for buffers when deriving part size,\n"
  "                       default is the available system memory\n"
  "      --memory-reserve Memory(MB) kept out when deriving part size, default\n"
  "                       value is " << to_string(GetDefaultMemoryReserveMB())
                          << "MB\n"
  "\n"
  "QingStor Options:\n"
  "  -z, --zone           Zone or region, default value is " << GetDefaultZone() << "\n"
  "      --host           Host name, default value is " << GetDefaultHostName() << "\n"
  "      --protocol       Protocol could be https or http, default value is "
                          << GetDefaultProtocolName() << "\n"
  "      --port           Specify port, default is 443 for https and 80 for http\n"
  "      --retries        Number of times to retry a failed request, default value\n"
  "                       is " << to_string(GetDefaultTransactionRetries()) << " times\n"
  "      --timeout        Time(seconds) to wait before timing out a request, default\n"
  "                       value is " << to_string(GetDefaultTransactionTimeDuration())
                          << " seconds\n"
  "      --credentials    Specify credentials file, default path is\n"
  "                       " << GetUserCredentialsFile() << " or "
                          << GetDefaultCredentialsFile() << "\n"
  "\n"
  "Miscellaneous Options:\n"
  "  -l, --logdir         Specify log directory, log to STDERR by default\n"
  "  -L, --loglevel       Min log level, message lower than this level don't logged;\n"
  "                       Specify one of following log level: INFO,WARN,ERROR,FATAL;\n"
  "                       " << GetDefaultLogLevelName() << " is set by default\n"
  "  -d, --debug          Turn on debug messages\n"
  "  -h, --help           Print qspipe help\n"
  "  -V, --version        Print qspipe version\n";
  cout.flush();
}

void ShowQSPipeUsage() {
  cout <<
  "Usage: qspipe -s|--size=<BYTES> [options] <SCHEME>://<BUCKET>/<KEY>\n"
  "       [-p|--part-size=[MB]] [-c|--concurrency=[value]]\n"
  "       [-a|--auto-part-size] [-m|--memory-limit=[MB]]\n"
  "       [--memory-reserve=[MB]]\n"
  "       [-z|--zone=[value]] [--host=[value]] [--protocol=[value]]\n"
  "       [--port=[value]] [--retries=[value]] [--timeout=[value]]\n"
  "       [--credentials=[file path]]\n"
  "       [-l|--logdir=[dir]] [-L|--loglevel=[INFO|WARN|ERROR|FATAL]]\n"
  "       [-d|--debug] [-h|--help] [-V|--version]\n";
  cout.flush();
}

}  // namespace HelpText
}  // namespace CLI
}  // namespace QSPipe
