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

#ifndef QSPIPE_DATA_CHUNK_H_
#define QSPIPE_DATA_CHUNK_H_

#include <stddef.h>

#include "data/BufferPool.h"

namespace QSPipe {

namespace Data {

// One contiguous slice of input to be uploaded as one part.
//
// The first GetLength() bytes of the pooled buffer hold the data. Whoever
// consumes the chunk must release the buffer back to the pool.
class Chunk {
 public:
  Chunk() : m_partNumber(0), m_length(0) {}
  Chunk(int partNumber, const Buffer &buffer, size_t length)
      : m_partNumber(partNumber), m_buffer(buffer), m_length(length) {}

  int GetPartNumber() const { return m_partNumber; }  // start from 1
  const Buffer &GetBuffer() const { return m_buffer; }
  size_t GetLength() const { return m_length; }
  bool IsEmpty() const { return m_partNumber <= 0 || !m_buffer; }

 private:
  int m_partNumber;
  Buffer m_buffer;
  size_t m_length;
};

}  // namespace Data
}  // namespace QSPipe

#endif  // QSPIPE_DATA_CHUNK_H_
