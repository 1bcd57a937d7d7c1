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

#include "transfer/UploadCoordinator.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <exception>
#include <istream>
#include <limits>
#include <string>
#include <vector>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/ThreadPool.h"
#include "client/Client.h"
#include "client/ClientError.hpp"
#include "client/QSError.h"
#include "configure/Default.h"
#include "data/BufferPool.h"
#include "data/Chunk.h"
#include "data/ChunkReader.h"
#include "data/CompletedPart.h"
#include "data/UploadSession.h"
#include "transfer/PartManifest.h"
#include "transfer/PartUploader.h"
#include "transfer/SizingPolicy.h"

namespace QSPipe {

namespace Transfer {

using boost::bind;
using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using boost::to_string;
using boost::unique_lock;
using QSPipe::Client::ClientError;
using QSPipe::Client::GetMessageForQSError;
using QSPipe::Client::IsGoodQSError;
using QSPipe::Client::QSError;
using QSPipe::Configure::Default::GetUploadMultipartMaxPartCount;
using QSPipe::Data::BufferPool;
using QSPipe::Data::Chunk;
using QSPipe::Data::ChunkReader;
using QSPipe::Data::CompletedPart;
using QSPipe::Data::UploadSession;
using QSPipe::Exception::ConfigError;
using QSPipe::Exception::QSPipeException;
using QSPipe::Exception::SessionError;
using QSPipe::Exception::UploadError;
using QSPipe::StringUtils::FormatSize;
using QSPipe::Threading::ThreadPool;
using std::istream;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
string GetSessionStateName(SessionState::Value state) {
  string name;
  switch (state) {
    case SessionState::Idle:
      name = "Idle";
      break;
    case SessionState::Opening:
      name = "Opening";
      break;
    case SessionState::Active:
      name = "Active";
      break;
    case SessionState::Completing:
      name = "Completing";
      break;
    case SessionState::Done:
      name = "Done";
      break;
    case SessionState::Aborting:
      name = "Aborting";
      break;
    case SessionState::Aborted:
      name = "Aborted";
      break;
    default:
      break;
  }
  return name;
}

// --------------------------------------------------------------------------
UploadCoordinator::UploadCoordinator(
    const shared_ptr<QSPipe::Client::Client> &client, const string &bucket,
    const string &objKey, uint64_t inputSize, uint64_t partSize,
    size_t concurrency)
    : m_client(client),
      m_bucket(bucket),
      m_objKey(objKey),
      m_inputSize(inputSize),
      m_partSize(partSize),
      m_concurrency(concurrency),
      m_workerCount(0),
      m_state(SessionState::Idle),
      m_started(false),
      m_abortIssued(false),
      m_cancelled(false),
      m_inFlight(0) {}

// --------------------------------------------------------------------------
UploadCoordinator::~UploadCoordinator() {
  // workers refer to the pools, stop them first
  m_executor.reset();
}

// --------------------------------------------------------------------------
string UploadCoordinator::Run(istream &input) {
  {
    lock_guard<mutex> lock(m_stateLock);
    if (m_started) {
      throw SessionError("Upload of " +
                         QSPipe::StringUtils::FormatObject(m_bucket, m_objKey) +
                         " has already been run");
    }
    m_started = true;
  }

  Validate();
  int partCount = static_cast<int>(CalculatePartCount(m_inputSize, m_partSize));
  m_session.reset(new UploadSession(m_bucket, m_objKey, m_partSize,
                                    m_inputSize, partCount));
  Info("Start multipart upload " << m_session->ToString() << " [size="
       << FormatSize(m_inputSize) << ", part size=" << FormatSize(m_partSize)
       << ", parts=" << partCount << ", concurrency=" << m_concurrency << "]");

  Open();

  // no more workers than parts
  if (m_concurrency > 1) {
    m_workerCount = std::min(m_concurrency, static_cast<size_t>(partCount));
  }
  // one buffer being filled by reader besides the ones being uploaded
  size_t maxBuffers = m_concurrency == 1 ? 1 : m_workerCount + 1;
  m_bufferPool.reset(new BufferPool(
      maxBuffers, ChunkReader::GetBufferSize(m_inputSize, m_partSize)));
  m_uploader.reset(new PartUploader(m_client, *m_bufferPool));
  m_manifest.reset(new PartManifest(partCount));

  string location;
  try {
    ChunkReader reader(input, m_inputSize, m_partSize, *m_bufferPool);
    if (m_concurrency == 1) {
      UploadSequentially(&reader);
    } else {
      UploadConcurrently(&reader);
    }
    location = Complete();
  } catch (const std::exception &err) {
    Error("Multipart upload " << m_session->ToString()
          << " failed: " << err.what());
    Abort();
    throw;
  }

  m_bufferPool->ShutdownAndWait();
  return location;
}

// --------------------------------------------------------------------------
void UploadCoordinator::Validate() const {
  if (m_inputSize == 0) {
    throw ConfigError("Input size must be greater than 0");
  }
  if (m_partSize == 0) {
    throw ConfigError("Part size must be greater than 0");
  }
  if (m_concurrency < 1) {
    throw ConfigError("Concurrency must be at least 1");
  }
  if (!m_client) {
    throw ConfigError("No storage client to upload with");
  }
  uint64_t partCount = CalculatePartCount(m_inputSize, m_partSize);
  if (partCount > GetUploadMultipartMaxPartCount()) {
    throw ConfigError("Input of " + FormatSize(m_inputSize) + " needs " +
                      to_string(partCount) + " parts of " +
                      FormatSize(m_partSize) + ", more than the limit " +
                      to_string(GetUploadMultipartMaxPartCount()));
  }
}

// --------------------------------------------------------------------------
void UploadCoordinator::Open() {
  SetState(SessionState::Opening);
  string uploadId;
  ClientError<QSError::Value> err = m_client->InitiateMultipartUpload(
      m_session->GetBucket(), m_session->GetObjectKey(), &uploadId);
  if (!IsGoodQSError(err) || uploadId.empty()) {
    // nothing is created on the backend, so nothing to abort
    SetState(SessionState::Aborted);
    string msg = IsGoodQSError(err) ? string("empty upload id")
                                    : GetMessageForQSError(err);
    throw SessionError("Fail to initiate multipart upload " +
                       m_session->ToString() + ": " + msg);
  }

  m_session->SetUploadId(uploadId);
  SetState(SessionState::Active);
  DebugInfo("Initiated multipart upload " << m_session->ToString()
            << " [upload id=" << uploadId << "]");
}

// --------------------------------------------------------------------------
void UploadCoordinator::UploadSequentially(ChunkReader *reader) {
  Chunk chunk;
  while (!IsCancelled() && reader->Next(&chunk)) {
    UploadPartOutcome outcome = m_uploader->Upload(*m_session, chunk);
    if (!outcome.IsSuccess()) {
      throw UploadError(chunk.GetPartNumber(),
                        GetMessageForQSError(outcome.GetError()));
    }
    m_manifest->Record(outcome.GetResult());
  }
  if (IsCancelled()) {
    throw SessionError("Multipart upload " + m_session->ToString() +
                       " is aborted");
  }
}

// --------------------------------------------------------------------------
void UploadCoordinator::UploadConcurrently(ChunkReader *reader) {
  m_executor.reset(new ThreadPool(m_workerCount));
  m_executor->Initialize();

  try {
    Chunk chunk;
    // reader blocks when all buffers are in flight
    while (!IsCancelled() && reader->Next(&chunk)) {
      {
        lock_guard<mutex> lock(m_lock);
        if (m_cancelled) {
          m_bufferPool->Release(chunk.GetBuffer());
          break;
        }
        ++m_inFlight;
      }
      m_executor->SubmitAsync(
          bind(boost::type<void>(), &UploadCoordinator::OnPartUploaded, this,
               _1, _2),
          bind(boost::type<UploadPartOutcome>(),
               &UploadCoordinator::DoUploadPart, this, _1),
          chunk);
    }
  } catch (const std::exception &) {
    bool first = Cancel();
    WaitForInFlightParts();
    m_executor.reset();
    if (first || !m_firstError) {
      throw;
    }
    m_firstError->Raise();
  }

  WaitForInFlightParts();
  m_executor.reset();

  if (m_firstError) {
    m_firstError->Raise();
  }
  if (IsCancelled()) {
    throw SessionError("Multipart upload " + m_session->ToString() +
                       " is aborted");
  }
}

// --------------------------------------------------------------------------
UploadPartOutcome UploadCoordinator::DoUploadPart(const Chunk &chunk) {
  if (IsCancelled()) {
    m_bufferPool->Release(chunk.GetBuffer());
    return UploadPartOutcome(ClientError<QSError::Value>(
        QSError::UNKNOWN, "UploadMultipart",
        "Cancelled before upload part " + to_string(chunk.GetPartNumber()),
        false));
  }
  return m_uploader->Upload(*m_session, chunk);
}

// --------------------------------------------------------------------------
void UploadCoordinator::OnPartUploaded(const UploadPartOutcome &outcome,
                                       const Chunk &chunk) {
  {
    lock_guard<mutex> lock(m_lock);
    if (m_cancelled) {
      DebugInfo("Discard result of part " << chunk.GetPartNumber()
                << " as upload is cancelled");
    } else if (outcome.IsSuccess()) {
      m_manifest->Record(outcome.GetResult());
    } else {
      m_firstError = shared_ptr<QSPipeException>(
          new UploadError(chunk.GetPartNumber(),
                          GetMessageForQSError(outcome.GetError())));
      m_cancelled = true;
    }
    --m_inFlight;
  }
  m_inFlightCond.notify_all();
}

// --------------------------------------------------------------------------
string UploadCoordinator::Complete() {
  SetState(SessionState::Completing);
  if (!m_manifest->IsComplete()) {
    throw SessionError("Only " + to_string(m_manifest->GetCompletedCount()) +
                       " of " + to_string(m_manifest->GetPartCount()) +
                       " parts are uploaded for " + m_session->ToString());
  }
  vector<CompletedPart> parts = m_manifest->GetSortedParts();

  string location;
  ClientError<QSError::Value> err = m_client->CompleteMultipartUpload(
      m_session->GetBucket(), m_session->GetObjectKey(),
      m_session->GetUploadId(), parts, &location);
  if (!IsGoodQSError(err)) {
    throw SessionError("Fail to complete multipart upload " +
                       m_session->ToString() + ": " +
                       GetMessageForQSError(err));
  }

  SetState(SessionState::Done);
  Info("Completed multipart upload " << m_session->ToString() << " ("
       << parts.size() << " parts, " << FormatSize(m_inputSize) << ")");
  return location;
}

// --------------------------------------------------------------------------
void UploadCoordinator::Abort() {
  {
    lock_guard<mutex> lock(m_lock);
    m_cancelled = true;
  }

  lock_guard<mutex> lock(m_abortLock);
  if (m_abortIssued) {
    DebugInfo("Multipart upload is already aborted");
    return;
  }
  if (!m_session || !m_session->IsOpened() ||
      GetState() == SessionState::Done) {
    return;
  }
  m_abortIssued = true;

  SetState(SessionState::Aborting);
  ClientError<QSError::Value> err = m_client->AbortMultipartUpload(
      m_session->GetBucket(), m_session->GetObjectKey(),
      m_session->GetUploadId());
  if (IsGoodQSError(err)) {
    Info("Aborted multipart upload " << m_session->ToString());
  } else {
    Warning("Fail to abort multipart upload " << m_session->ToString()
            << " [upload id=" << m_session->GetUploadId()
            << "]: " << GetMessageForQSError(err));
  }
  SetState(SessionState::Aborted);
}

// --------------------------------------------------------------------------
bool UploadCoordinator::Cancel() {
  lock_guard<mutex> lock(m_lock);
  bool first = !m_cancelled;
  m_cancelled = true;
  return first;
}

// --------------------------------------------------------------------------
bool UploadCoordinator::IsCancelled() const {
  lock_guard<mutex> lock(m_lock);
  return m_cancelled;
}

// --------------------------------------------------------------------------
void UploadCoordinator::WaitForInFlightParts() {
  unique_lock<mutex> lock(m_lock);
  while (m_inFlight > 0) {
    m_inFlightCond.wait(lock);
  }
}

// --------------------------------------------------------------------------
SessionState::Value UploadCoordinator::GetState() const {
  lock_guard<mutex> lock(m_stateLock);
  return m_state;
}

// --------------------------------------------------------------------------
void UploadCoordinator::SetState(SessionState::Value state) {
  lock_guard<mutex> lock(m_stateLock);
  DebugInfo("Session state " << GetSessionStateName(m_state) << " -> "
            << GetSessionStateName(state));
  m_state = state;
}

// --------------------------------------------------------------------------
const string &UploadCoordinator::GetUploadId() const {
  static const string empty;
  return m_session ? m_session->GetUploadId() : empty;
}

// --------------------------------------------------------------------------
int UploadCoordinator::GetPartCount() const {
  return m_session ? m_session->GetPartCount() : 0;
}

// --------------------------------------------------------------------------
size_t UploadCoordinator::GetAllocatedBufferCount() const {
  return m_bufferPool ? m_bufferPool->GetAllocatedCount() : 0;
}

// --------------------------------------------------------------------------
vector<CompletedPart> UploadCoordinator::GetManifest() const {
  if (!m_manifest || GetState() != SessionState::Done) {
    return vector<CompletedPart>();
  }
  return m_manifest->GetSortedParts();
}

}  // namespace Transfer
}  // namespace QSPipe
