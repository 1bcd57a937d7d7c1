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

#include "data/ChunkReader.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <istream>
#include <string>

#include "boost/exception/to_string.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "data/BufferPool.h"
#include "data/Chunk.h"

namespace QSPipe {

namespace Data {

using boost::to_string;
using QSPipe::Exception::ConfigError;
using QSPipe::Exception::InputError;
using QSPipe::Exception::QSPipeException;
using std::istream;
using std::min;
using std::string;

// --------------------------------------------------------------------------
ChunkReader::ChunkReader(istream &input, uint64_t inputSize, uint64_t partSize,
                         BufferPool &pool)
    : m_input(input),
      m_inputSize(inputSize),
      m_partSize(partSize),
      m_pool(pool),
      m_bytesRead(0),
      m_nextPartNumber(1) {
  if (m_partSize == 0) {
    throw ConfigError("Part size must be greater than 0");
  }
}

// --------------------------------------------------------------------------
bool ChunkReader::Next(Chunk *chunk) {
  if (!HasNext()) {
    return false;
  }

  size_t len = static_cast<size_t>(min(m_partSize, m_inputSize - m_bytesRead));
  Buffer buffer = m_pool.Acquire();
  if (!buffer) {
    throw QSPipeException("Unable to read part " +
                          to_string(m_nextPartNumber) +
                          " as buffer pool is shutdown");
  }
  if (buffer->size() < len) {
    m_pool.Release(buffer);
    throw QSPipeException("Pooled buffer of " + to_string(buffer->size()) +
                          " bytes is too small for part of " +
                          to_string(len) + " bytes");
  }

  m_input.read(&(*buffer)[0], static_cast<std::streamsize>(len));
  size_t got = static_cast<size_t>(m_input.gcount());
  if (got < len) {
    m_pool.Release(buffer);
    uint64_t total = m_bytesRead + got;
    if (m_input.eof()) {
      throw InputError("Input truncated: expect " + to_string(m_inputSize) +
                       " bytes but got only " + to_string(total) + " bytes");
    }
    throw InputError("Fail to read input at offset " + to_string(total));
  }

  m_bytesRead += len;
  if (chunk != NULL) {
    *chunk = Chunk(m_nextPartNumber, buffer, len);
  }
  DebugInfo("Read part " << m_nextPartNumber << " (" << len << " bytes)");
  ++m_nextPartNumber;
  return true;
}

// --------------------------------------------------------------------------
size_t ChunkReader::GetBufferSize(uint64_t inputSize, uint64_t partSize) {
  return static_cast<size_t>(min(inputSize, partSize));
}

}  // namespace Data
}  // namespace QSPipe
