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

#include <stdint.h>

#include <exception>
#include <iostream>
#include <string>

#include "boost/shared_ptr.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/Logging.h"
#include "base/Size.h"
#include "cli/HelpText.h"
#include "cli/Parser.h"
#include "client/ClientConfiguration.h"
#include "client/Credentials.h"
#include "client/QSClient.h"
#include "configure/Default.h"
#include "configure/Options.h"
#include "transfer/SizingPolicy.h"
#include "transfer/UploadCoordinator.h"

using boost::shared_ptr;
using QSPipe::Client::ClientConfiguration;
using QSPipe::Client::Credentials;
using QSPipe::Client::DefaultCredentialsProvider;
using QSPipe::Client::QSClient;
using QSPipe::Client::ResolveCredentialsFile;
using QSPipe::CLI::HelpText::ShowQSPipeHelp;
using QSPipe::CLI::HelpText::ShowQSPipeUsage;
using QSPipe::CLI::HelpText::ShowQSPipeVersion;
using QSPipe::Configure::Default::GetProgramName;
using QSPipe::Configure::Options;
using QSPipe::Exception::ConfigError;
using QSPipe::Exception::QSPipeException;
using QSPipe::Transfer::SizingPolicy;
using QSPipe::Transfer::SizingRequest;
using QSPipe::Transfer::UploadCoordinator;
using std::string;

namespace {
void CheckBucketName();
uint64_t ChoosePartSize();
string Upload(bool *serviceStarted);

struct ErrorHandle {
  int *ret;
  explicit ErrorHandle(int *ret_) : ret(ret_) {}

  void operator()(const char *err) {
    if (ret) {
      *ret = 1;
    }
    if (err) {
      std::cerr << "[" << GetProgramName() << " ERROR] " << err << "\n";
    }
  }
};
}  // namespace

int main(int argc, char **argv) {
  int ret = 0;
  ErrorHandle errorHandle(&ret);
  std::ios::sync_with_stdio(false);

  // Parse command line arguments.
  try {
    QSPipe::CLI::Parser::Parse(argc, argv);
  } catch (const ConfigError &err) {
    ShowQSPipeUsage();
    errorHandle(err.what());
    return ret;
  }

  const Options &options = Options::Instance();
  if (options.IsNoUpload()) {
    if (options.IsShowVersion()) {
      ShowQSPipeVersion();
    }
    if (options.IsShowHelp()) {
      ShowQSPipeHelp();
    }
    return ret;
  }

  bool serviceStarted = false;
  try {
    // Notice: DO NOT use logging before initialization done.
    QSPipe::Logging::Log::Instance().Initialize(
        options.GetLogDirectory(), options.GetLogLevel(), options.IsDebug());
    DebugInfo("Options: " << options);

    CheckBucketName();
    string location = Upload(&serviceStarted);
    std::cout << location << std::endl;
  } catch (const QSPipeException &err) {
    errorHandle(err.what());
  } catch (const std::exception &err) {
    errorHandle(err.what());
  }

  if (serviceStarted) {
    QSClient::CloseQSService();
  }
  return ret;
}

namespace {

static const char *illegalChars = "/:\\;!@#$%^&*?|+= ";

// --------------------------------------------------------------------------
void CheckBucketName() {
  const Options &options = Options::Instance();
  if (options.GetBucket().find_first_of(illegalChars) != string::npos) {
    throw ConfigError("BUCKET " + options.GetBucket() +
                      " -- bucket name contains an illegal character of " +
                      illegalChars);
  }
}

// --------------------------------------------------------------------------
uint64_t ChoosePartSize() {
  const Options &options = Options::Instance();
  SizingRequest request;
  request.inputSize = options.GetInputSize();
  request.concurrency = options.GetConcurrency();
  if (options.IsAutoPartSize() && !options.IsPartSizeSpecified()) {
    request.memoryLimit = options.GetMemoryLimitInMB() * QSPipe::Size::MB1;
    request.memoryReserve = options.GetMemoryReserveInMB() * QSPipe::Size::MB1;
  } else {
    WarningIf(options.IsAutoPartSize(),
              "Part size is specified, ignore auto part size");
    request.partSize =
        static_cast<uint64_t>(options.GetPartSizeInMB()) * QSPipe::Size::MB1;
  }
  return SizingPolicy().CalculatePartSize(request);
}

// --------------------------------------------------------------------------
string Upload(bool *serviceStarted) {
  const Options &options = Options::Instance();
  uint64_t partSize = ChoosePartSize();

  DefaultCredentialsProvider provider(
      ResolveCredentialsFile(options.GetCredentialsFile()));
  Credentials credentials = provider.GetCredentials(options.GetBucket());

  ClientConfiguration config(credentials);
  config.InitializeByOptions(options);

  shared_ptr<QSPipe::Client::Client> client(new QSClient(config));
  *serviceStarted = true;  // sdk is started by the first client
  UploadCoordinator coordinator(client, options.GetBucket(),
                                options.GetObjectKey(), options.GetInputSize(),
                                partSize, options.GetConcurrency());
  return coordinator.Run(std::cin);
}

}  // namespace
