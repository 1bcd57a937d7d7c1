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
#ifndef QSPIPE_TEST_MOCKCLIENT_H_
#define QSPIPE_TEST_MOCKCLIENT_H_

#include <stdint.h>

#include <iostream>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"
#include "boost/thread/thread_time.hpp"

#include "client/Client.h"
#include "client/ClientError.hpp"
#include "client/QSError.h"
#include "data/CompletedPart.h"

namespace QSPipe {

namespace Client {

//
// RecordingClient
//
// In memory storage client which records every request it gets. Any of the
// requests can be told to fail. Stored parts are kept by part number.
//
class RecordingClient : public Client {
 public:
  RecordingClient()
      : m_initiateCount(0),
        m_uploadCount(0),
        m_completeCount(0),
        m_abortCount(0),
        m_inFlight(0),
        m_maxInFlight(0),
        m_failInitiate(false),
        m_emptyUploadId(false),
        m_failComplete(false),
        m_failAbort(false),
        m_uploadDelayMs(0) {}

  ~RecordingClient() {}

 public:
  ClientError<QSError::Value> InitiateMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      std::string *uploadId) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    ++m_initiateCount;
    if (m_failInitiate) {
      return ClientError<QSError::Value>(
          QSError::PERMISSION_DENIED, "QingStorInitiateMultipartUpload",
          "access denied", false);
    }
    m_bucket = bucket;
    m_objKey = objKey;
    *uploadId = m_emptyUploadId ? std::string() : std::string("upload-1");
    return ClientError<QSError::Value>(QSError::GOOD, false);
  }

  ClientError<QSError::Value> UploadMultipart(
      const std::string &bucket, const std::string &objKey,
      const std::string &uploadId, int partNumber, uint64_t contentLength,
      const boost::shared_ptr<std::iostream> &body, std::string *eTag) {
    {
      boost::lock_guard<boost::mutex> lock(m_lock);
      ++m_uploadCount;
      ++m_inFlight;
      if (m_inFlight > m_maxInFlight) {
        m_maxInFlight = m_inFlight;
      }
    }

    // odd parts finish later, so parts complete out of order
    if (m_uploadDelayMs > 0 && partNumber % 2 == 1) {
      boost::this_thread::sleep(
          boost::posix_time::milliseconds(m_uploadDelayMs));
    }

    body->seekg(0, std::ios_base::beg);
    std::string data((std::istreambuf_iterator<char>(*body)),
                     std::istreambuf_iterator<char>());

    boost::lock_guard<boost::mutex> lock(m_lock);
    --m_inFlight;
    if (m_failParts.count(partNumber) > 0) {
      return ClientError<QSError::Value>(QSError::SDK_REQUEST_SEND_ERROR,
                                         "QingStorUploadMultipart",
                                         "connection reset", true);
    }
    if (uploadId != "upload-1" || bucket != m_bucket || objKey != m_objKey ||
        data.size() != contentLength) {
      return ClientError<QSError::Value>(QSError::PARAMETER_MISSING,
                                         "QingStorUploadMultipart",
                                         "unexpected request", false);
    }
    m_parts[partNumber] = data;
    *eTag = "etag-" + boost::to_string(partNumber);
    return ClientError<QSError::Value>(QSError::GOOD, false);
  }

  ClientError<QSError::Value> CompleteMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      const std::string &uploadId,
      const std::vector<QSPipe::Data::CompletedPart> &sortedParts,
      std::string *location) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    ++m_completeCount;
    m_completedParts = sortedParts;
    if (m_failComplete) {
      return ClientError<QSError::Value>(QSError::SDK_UNEXPECTED_RESPONSE,
                                         "QingStorCompleteMultipartUpload",
                                         "invalid part order", false);
    }
    *location = "https://" + bucket + ".pek3a.qingstor.com/" + objKey;
    return ClientError<QSError::Value>(QSError::GOOD, false);
  }

  ClientError<QSError::Value> AbortMultipartUpload(
      const std::string &bucket, const std::string &objKey,
      const std::string &uploadId) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    ++m_abortCount;
    m_parts.clear();
    if (m_failAbort) {
      return ClientError<QSError::Value>(QSError::NOT_FOUND,
                                         "QingStorAbortMultipartUpload",
                                         "no such upload", false);
    }
    return ClientError<QSError::Value>(QSError::GOOD, false);
  }

 public:
  void SetFailInitiate(bool fail) { m_failInitiate = fail; }
  void SetEmptyUploadId(bool empty) { m_emptyUploadId = empty; }
  void SetFailPart(int partNumber) {
    m_failParts.clear();
    m_failParts.insert(partNumber);
  }
  void AddFailPart(int partNumber) { m_failParts.insert(partNumber); }
  void SetFailComplete(bool fail) { m_failComplete = fail; }
  void SetFailAbort(bool fail) { m_failAbort = fail; }
  void SetUploadDelay(int milliseconds) { m_uploadDelayMs = milliseconds; }

  int GetInitiateCount() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_initiateCount;
  }
  int GetUploadCount() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_uploadCount;
  }
  int GetCompleteCount() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_completeCount;
  }
  int GetAbortCount() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_abortCount;
  }
  int GetMaxInFlight() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_maxInFlight;
  }
  std::vector<QSPipe::Data::CompletedPart> GetCompletedParts() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_completedParts;
  }

  // Concatenate the stored parts in part number order
  std::string GetObjectData() {
    boost::lock_guard<boost::mutex> lock(m_lock);
    std::string data;
    for (std::map<int, std::string>::const_iterator it = m_parts.begin();
         it != m_parts.end(); ++it) {
      data += it->second;
    }
    return data;
  }

 private:
  std::string m_bucket;
  std::string m_objKey;
  std::map<int, std::string> m_parts;
  std::vector<QSPipe::Data::CompletedPart> m_completedParts;
  int m_initiateCount;
  int m_uploadCount;
  int m_completeCount;
  int m_abortCount;
  int m_inFlight;
  int m_maxInFlight;
  bool m_failInitiate;
  bool m_emptyUploadId;
  std::set<int> m_failParts;
  bool m_failComplete;
  bool m_failAbort;
  int m_uploadDelayMs;
  boost::mutex m_lock;
};

}  // namespace Client
}  // namespace QSPipe

#endif  // QSPIPE_TEST_MOCKCLIENT_H_
