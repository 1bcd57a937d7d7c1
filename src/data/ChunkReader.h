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

#ifndef QSPIPE_DATA_CHUNKREADER_H_
#define QSPIPE_DATA_CHUNKREADER_H_

#include <stddef.h>
#include <stdint.h>

#include <istream>

#include "boost/noncopyable.hpp"

#include "data/BufferPool.h"
#include "data/Chunk.h"

namespace QSPipe {

namespace Data {

/**
 * Splits a one pass input stream into chunks of part size.
 *
 * Every chunk is exactly part size bytes except the last one, which holds
 * the remainder. Never reads beyond the declared input size, any extra
 * bytes in the stream are left unread. Each chunk holds a buffer acquired
 * from the pool, so Next blocks while all buffers are in use.
 */
class ChunkReader : private boost::noncopyable {
 public:
  // Throw ConfigError if part size is 0
  ChunkReader(std::istream &input, uint64_t inputSize, uint64_t partSize,
              BufferPool &pool);

  ~ChunkReader() {}

 public:
  // Read next chunk
  //
  // @param  : chunk(output)
  // @return : false if all declared bytes have been read
  //
  // Throw InputError if the stream ends before the declared size or
  // fails to read. The buffer is returned to the pool before throwing.
  bool Next(Chunk *chunk);

  bool HasNext() const { return m_bytesRead < m_inputSize; }
  uint64_t GetBytesRead() const { return m_bytesRead; }
  int GetChunkCount() const { return m_nextPartNumber - 1; }

  // Buffer size needed to hold any chunk, a small input never needs
  // a full part buffer.
  static size_t GetBufferSize(uint64_t inputSize, uint64_t partSize);

 private:
  std::istream &m_input;
  uint64_t m_inputSize;
  uint64_t m_partSize;
  BufferPool &m_pool;
  uint64_t m_bytesRead;
  int m_nextPartNumber;
};

}  // namespace Data
}  // namespace QSPipe

#endif  // QSPIPE_DATA_CHUNKREADER_H_
