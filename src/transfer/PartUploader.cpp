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

#include "transfer/PartUploader.h"

#include <exception>
#include <string>

#include "boost/scope_exit.hpp"
#include "boost/shared_ptr.hpp"

#include "base/LogMacros.h"
#include "client/Client.h"
#include "client/ClientError.hpp"
#include "client/QSError.h"
#include "data/BufferPool.h"
#include "data/Chunk.h"
#include "data/CompletedPart.h"
#include "data/IOStream.h"
#include "data/UploadSession.h"

namespace QSPipe {

namespace Transfer {

using boost::shared_ptr;
using QSPipe::Client::ClientError;
using QSPipe::Client::GetMessageForQSError;
using QSPipe::Client::IsGoodQSError;
using QSPipe::Client::QSError;
using QSPipe::Data::BufferPool;
using QSPipe::Data::Chunk;
using QSPipe::Data::CompletedPart;
using QSPipe::Data::IOStream;
using QSPipe::Data::UploadSession;
using std::iostream;
using std::string;

// --------------------------------------------------------------------------
PartUploader::PartUploader(
    const shared_ptr<QSPipe::Client::Client> &client, BufferPool &pool)
    : m_client(client), m_pool(pool) {}

// --------------------------------------------------------------------------
UploadPartOutcome PartUploader::Upload(const UploadSession &session,
                                       const Chunk &chunk) const {
  BufferPool &pool = m_pool;
  const Chunk &releasing = chunk;
  BOOST_SCOPE_EXIT((&pool)(&releasing)) {
    pool.Release(releasing.GetBuffer());
  }
  BOOST_SCOPE_EXIT_END

  int partNumber = chunk.GetPartNumber();
  ClientError<QSError::Value> err;
  string eTag;
  try {
    shared_ptr<iostream> body(
        new IOStream(chunk.GetBuffer(), chunk.GetLength()));
    err = m_client->UploadMultipart(
        session.GetBucket(), session.GetObjectKey(), session.GetUploadId(),
        partNumber, chunk.GetLength(), body, &eTag);
  } catch (const std::exception &e) {
    err = ClientError<QSError::Value>(QSError::UNKNOWN, "UploadMultipart",
                                      e.what(), false);
  }

  if (!IsGoodQSError(err)) {
    DebugError("Fail to upload part " << partNumber << " of "
               << session.ToString() << ": " << GetMessageForQSError(err));
    return UploadPartOutcome(err);
  }

  Info("Uploaded part " << partNumber << " (" << chunk.GetLength()
       << " bytes)");
  return UploadPartOutcome(CompletedPart(partNumber, eTag));
}

}  // namespace Transfer
}  // namespace QSPipe
