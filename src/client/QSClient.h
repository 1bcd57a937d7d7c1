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

#ifndef QSPIPE_CLIENT_QSCLIENT_H_
#define QSPIPE_CLIENT_QSCLIENT_H_

#include <stdint.h>

#include <iostream>
#include <string>
#include <vector>

#include "boost/shared_ptr.hpp"

#include "qingstor/QingStor.h"

#include "client/Client.h"
#include "client/ClientConfiguration.h"

namespace QingStor {
class QsConfig;
}  // namespace QingStor

namespace QSPipe {

namespace Client {

class QSClientImpl;

//
// QSClient
//
// Client of QingStor object storage. The sdk is started once for the whole
// process by the first QSClient, and shut down by CloseQSService.
//
class QSClient : public Client {
 public:
  explicit QSClient(const ClientConfiguration &config);
  ~QSClient() {}

 public:
  ClientError<QSError::Value> InitiateMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      std::string *uploadId);

  ClientError<QSError::Value> UploadMultipart(
      const std::string &bucket, const std::string &objKey,
      const std::string &uploadId, int partNumber, uint64_t contentLength,
      const boost::shared_ptr<std::iostream> &body, std::string *eTag);

  // Complete multipart upload
  //
  // @param  : bucket, object key, upload id, sorted parts, location(output)
  // @return : ClientError
  //
  // The sdk returns no location of the assembled object, it is built from
  // the endpoint, e.g. "https://mybucket.pek3a.qingstor.com/dir/file".
  ClientError<QSError::Value> CompleteMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      const std::string &uploadId,
      const std::vector<QSPipe::Data::CompletedPart> &sortedParts,
      std::string *location);

  ClientError<QSError::Value> AbortMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      const std::string &uploadId);

 public:
  // Shut down the sdk, no request should be issued after this
  static void CloseQSService();

 private:
  const boost::shared_ptr<QSClientImpl> &GetQSClientImpl() const {
    return m_qsClientImpl;
  }
  static void StartQSService(const ClientConfiguration &config);
  static void DoStartQSService(const ClientConfiguration &config);

 private:
  static QingStor::SDKOptions m_sdkOptions;
  static boost::shared_ptr<QingStor::QsConfig> m_qingStorConfig;
  ClientConfiguration m_config;
  boost::shared_ptr<QSClientImpl> m_qsClientImpl;
};

}  // namespace Client
}  // namespace QSPipe

#endif  // QSPIPE_CLIENT_QSCLIENT_H_
