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

#ifndef QSPIPE_CLIENT_QSCLIENTIMPL_H_
#define QSPIPE_CLIENT_QSCLIENTIMPL_H_

#include <string>

#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/unordered_map.hpp"

#include "qingstor/Bucket.h"  // for instantiation of QSClientImpl
#include "qingstor/QsConfig.h"

#include "client/ClientImpl.h"
#include "client/QSClientOutcome.h"

namespace QSPipe {

namespace Client {

//
// QSClientImpl
//
// Thin wrapper of qingstor sdk Bucket. Each sdk call is turned into an
// Outcome, failures are converted to ClientError carrying the response
// code and error info from the server.
//
class QSClientImpl : public ClientImpl {
 public:
  QSClientImpl(const boost::shared_ptr<QingStor::QsConfig> &qsConfig,
               const std::string &zone);

  ~QSClientImpl() {}

 public:
  //
  // Multipart Operations
  //

  // Initiate multipart upload
  //
  // @param  : bucket, object key, InitiateMultipartUploadInput
  // @return : InitiateMultipartUploadOutcome
  InitiateMultipartUploadOutcome InitiateMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      QingStor::InitiateMultipartUploadInput *input);

  // Upload multipart
  //
  // @param  : bucket, object key, UploadMultipartInput
  // @return : UploadMultipartOutcome
  UploadMultipartOutcome UploadMultipart(
      const std::string &bucket, const std::string &objKey,
      QingStor::UploadMultipartInput *input);

  // Complete multipart upload
  //
  // @param  : bucket, object key, CompleteMultipartUploadInput
  // @return : CompleteMultipartUploadOutcome
  CompleteMultipartUploadOutcome CompleteMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      QingStor::CompleteMultipartUploadInput *input);

  // Abort multipart upload
  //
  // @param  : bucket, object key, AbortMultipartUploadInput
  // @return : AbortMultipartUploadOutcome
  AbortMultipartUploadOutcome AbortMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      QingStor::AbortMultipartUploadInput *input);

 private:
  // Get the sdk bucket, create it at first use
  boost::shared_ptr<QingStor::Bucket> GetBucket(const std::string &bucket);

 private:
  typedef boost::unordered_map<std::string,
                               boost::shared_ptr<QingStor::Bucket> >
      BucketMap;

  boost::shared_ptr<QingStor::QsConfig> m_qsConfig;
  std::string m_zone;
  BucketMap m_buckets;
  boost::mutex m_bucketsLock;
};

}  // namespace Client
}  // namespace QSPipe

#endif  // QSPIPE_CLIENT_QSCLIENTIMPL_H_
