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

#ifndef QSPIPE_TRANSFER_UPLOADCOORDINATOR_H_
#define QSPIPE_TRANSFER_UPLOADCOORDINATOR_H_

#include <stddef.h>
#include <stdint.h>

#include <istream>
#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

#include "data/CompletedPart.h"
#include "transfer/PartUploader.h"

namespace QSPipe {

namespace Client {
class Client;
}  // namespace Client

namespace Data {
class BufferPool;
class Chunk;
class ChunkReader;
class UploadSession;
}  // namespace Data

namespace Exception {
struct QSPipeException;
}  // namespace Exception

namespace Threading {
class ThreadPool;
}  // namespace Threading

namespace Transfer {

class PartManifest;

struct SessionState {
  enum Value {
    Idle,
    Opening,
    Active,
    Completing,
    Done,
    Aborting,
    Aborted
  };
};

std::string GetSessionStateName(SessionState::Value state);

//
// UploadCoordinator
//
// Drives one multipart upload: open the session, split the input into
// parts, upload them with at most concurrency parts in flight, and then
// complete the session with the ordered manifest.
//
// Once the session is opened, any failure aborts it before the error is
// reported, so no partial object is left behind. With concurrency 1 parts
// are read and uploaded one after another on the calling thread.
//
// A coordinator runs only once.
//
class UploadCoordinator : private boost::noncopyable {
 public:
  UploadCoordinator(const boost::shared_ptr<QSPipe::Client::Client> &client,
                    const std::string &bucket, const std::string &objKey,
                    uint64_t inputSize, uint64_t partSize,
                    size_t concurrency);

  ~UploadCoordinator();

 public:
  // Upload input as the object
  //
  // @param  : input stream providing exactly input size bytes
  // @return : location of the object
  //
  // Throw ConfigError on invalid size, part size or concurrency before
  // opening the session. Throw SessionError if the session cannot be opened
  // or completed, InputError if input is short or unreadable, UploadError
  // if a part is rejected. Throw SessionError if called more than once.
  std::string Run(std::istream &input);

  // Abort the session
  //
  // Only the first call reaches the backend, later calls do nothing.
  // Nothing is sent if the session is not opened or already completed.
  // A failed abort is logged, never thrown.
  void Abort();

 public:
  SessionState::Value GetState() const;
  const std::string &GetUploadId() const;
  int GetPartCount() const;
  size_t GetConcurrency() const { return m_concurrency; }
  // Worker threads of the last run, 0 if parts are uploaded sequentially
  size_t GetWorkerCount() const { return m_workerCount; }
  // Buffers the last run has allocated
  size_t GetAllocatedBufferCount() const;

  // Parts sorted by part number, available once the session is done
  std::vector<QSPipe::Data::CompletedPart> GetManifest() const;

 private:
  void Validate() const;
  void Open();
  void UploadSequentially(QSPipe::Data::ChunkReader *reader);
  void UploadConcurrently(QSPipe::Data::ChunkReader *reader);
  std::string Complete();

  // Run on worker thread
  UploadPartOutcome DoUploadPart(const QSPipe::Data::Chunk &chunk);
  // Run on worker thread after DoUploadPart
  void OnPartUploaded(const UploadPartOutcome &outcome,
                      const QSPipe::Data::Chunk &chunk);

  // Stop dispatching parts
  //
  // @return : true if no error is recorded before
  bool Cancel();
  bool IsCancelled() const;
  void WaitForInFlightParts();

  void SetState(SessionState::Value state);

 private:
  boost::shared_ptr<QSPipe::Client::Client> m_client;
  std::string m_bucket;
  std::string m_objKey;
  uint64_t m_inputSize;
  uint64_t m_partSize;
  size_t m_concurrency;
  size_t m_workerCount;  // min(concurrency, part count) when concurrent

  boost::scoped_ptr<QSPipe::Data::UploadSession> m_session;
  boost::scoped_ptr<QSPipe::Data::BufferPool> m_bufferPool;
  boost::scoped_ptr<PartUploader> m_uploader;
  boost::scoped_ptr<PartManifest> m_manifest;
  boost::scoped_ptr<QSPipe::Threading::ThreadPool> m_executor;

  SessionState::Value m_state;
  mutable boost::mutex m_stateLock;
  bool m_started;

  bool m_abortIssued;
  boost::mutex m_abortLock;

  // shared with workers
  boost::shared_ptr<QSPipe::Exception::QSPipeException> m_firstError;
  bool m_cancelled;
  size_t m_inFlight;  // parts submitted and not handled yet
  mutable boost::mutex m_lock;
  boost::condition_variable m_inFlightCond;
};

}  // namespace Transfer
}  // namespace QSPipe

#endif  // QSPIPE_TRANSFER_UPLOADCOORDINATOR_H_
