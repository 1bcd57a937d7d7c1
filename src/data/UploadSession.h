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

#ifndef QSPIPE_DATA_UPLOADSESSION_H_
#define QSPIPE_DATA_UPLOADSESSION_H_

#include <stdint.h>

#include <string>

namespace QSPipe {

namespace Transfer {
class UploadCoordinator;
}  // namespace Transfer

namespace Data {

// A multipart upload of one object.
//
// The upload id is empty until the backend opened the upload.
class UploadSession {
 public:
  UploadSession(const std::string &bucket, const std::string &objKey,
                uint64_t partSize, uint64_t inputSize, int partCount)
      : m_bucket(bucket),
        m_objKey(objKey),
        m_partSize(partSize),
        m_inputSize(inputSize),
        m_partCount(partCount) {}

 public:
  const std::string &GetBucket() const { return m_bucket; }
  const std::string &GetObjectKey() const { return m_objKey; }
  const std::string &GetUploadId() const { return m_uploadId; }
  uint64_t GetPartSize() const { return m_partSize; }
  uint64_t GetInputSize() const { return m_inputSize; }
  int GetPartCount() const { return m_partCount; }
  bool IsOpened() const { return !m_uploadId.empty(); }

  // Return string like "[bucket=mybucket, key=dir/file]"
  std::string ToString() const;

 private:
  void SetUploadId(const std::string &uploadId) { m_uploadId = uploadId; }

 private:
  std::string m_bucket;
  std::string m_objKey;
  std::string m_uploadId;
  uint64_t m_partSize;
  uint64_t m_inputSize;
  int m_partCount;

  friend class QSPipe::Transfer::UploadCoordinator;
};

}  // namespace Data
}  // namespace QSPipe

#endif  // QSPIPE_DATA_UPLOADSESSION_H_
