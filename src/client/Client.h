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

#ifndef QSPIPE_CLIENT_CLIENT_H_
#define QSPIPE_CLIENT_CLIENT_H_

#include <stdint.h>

#include <iostream>
#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/QSError.h"
#include "data/CompletedPart.h"

namespace QSPipe {

namespace Client {

class ClientImpl;

//
// Client
//
// Storage client of the multipart upload protocol. Implementations take
// care of transport details (endpoints, signing, retries); callers only see
// a ClientError for each request.
//
// All methods must be safe to call from several threads at the same time,
// as parts are uploaded by concurrent workers.
//
class Client : private boost::noncopyable {
 public:
  explicit Client(const boost::shared_ptr<ClientImpl> &impl =
                      boost::shared_ptr<ClientImpl>());

  virtual ~Client();

 public:
  // Initiate multipart upload
  //
  // @param  : bucket, object key, upload id(output)
  // @return : ClientError
  virtual ClientError<QSError::Value> InitiateMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      std::string *uploadId) = 0;

  // Upload one part of a multipart upload
  //
  // @param  : bucket, object key, upload id, part number (start from 1),
  //           content length, body stream, etag(output)
  // @return : ClientError
  virtual ClientError<QSError::Value> UploadMultipart(
      const std::string &bucket, const std::string &objKey,
      const std::string &uploadId, int partNumber, uint64_t contentLength,
      const boost::shared_ptr<std::iostream> &body, std::string *eTag) = 0;

  // Complete multipart upload
  //
  // @param  : bucket, object key, upload id, parts sorted by part number,
  //           location(output)
  // @return : ClientError
  virtual ClientError<QSError::Value> CompleteMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      const std::string &uploadId,
      const std::vector<QSPipe::Data::CompletedPart> &sortedParts,
      std::string *location) = 0;

  // Abort multipart upload
  //
  // @param  : bucket, object key, upload id
  // @return : ClientError
  virtual ClientError<QSError::Value> AbortMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      const std::string &uploadId) = 0;

 protected:
  const boost::shared_ptr<ClientImpl> &GetClientImpl() const { return m_impl; }

 private:
  boost::shared_ptr<ClientImpl> m_impl;
};

}  // namespace Client
}  // namespace QSPipe

#endif  // QSPIPE_CLIENT_CLIENT_H_
