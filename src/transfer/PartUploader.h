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

#ifndef QSPIPE_TRANSFER_PARTUPLOADER_H_
#define QSPIPE_TRANSFER_PARTUPLOADER_H_

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/ClientError.hpp"
#include "client/Outcome.hpp"
#include "client/QSError.h"
#include "data/CompletedPart.h"

namespace QSPipe {

namespace Client {
class Client;
}  // namespace Client

namespace Data {
class BufferPool;
class Chunk;
class UploadSession;
}  // namespace Data

namespace Transfer {

typedef QSPipe::Client::Outcome<
    QSPipe::Data::CompletedPart,
    QSPipe::Client::ClientError<QSPipe::Client::QSError::Value> >
    UploadPartOutcome;

//
// PartUploader
//
// Uploads one chunk as one part of the session. It holds no state of its
// own, so one uploader is shared by all workers. No retry here, retries
// of a request are up to the client.
//
class PartUploader : private boost::noncopyable {
 public:
  PartUploader(const boost::shared_ptr<QSPipe::Client::Client> &client,
               QSPipe::Data::BufferPool &pool);

 public:
  // Upload chunk
  //
  // @param  : session, chunk
  // @return : completed part, or the client error
  //
  // The chunk buffer is always released back to pool before returning.
  UploadPartOutcome Upload(const QSPipe::Data::UploadSession &session,
                           const QSPipe::Data::Chunk &chunk) const;

 private:
  boost::shared_ptr<QSPipe::Client::Client> m_client;
  QSPipe::Data::BufferPool &m_pool;
};

}  // namespace Transfer
}  // namespace QSPipe

#endif  // QSPIPE_TRANSFER_PARTUPLOADER_H_
