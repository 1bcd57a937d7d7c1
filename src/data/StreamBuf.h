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

#ifndef QSPIPE_DATA_STREAMBUF_H_
#define QSPIPE_DATA_STREAMBUF_H_

#include <stddef.h>  // for size_t

#include <streambuf>  // NOLINT

#include "boost/noncopyable.hpp"

#include "data/BufferPool.h"

namespace QSPipe {

namespace Data {

class IOStream;

/**
 * A stream buf over a pooled buffer to use with std::iostream.
 *
 * Only the first lengthToRead bytes of the buffer are visible to the
 * stream, e.g. a final part shorter than the pooled buffer.
 */
class StreamBuf : public std::streambuf, private boost::noncopyable {
 public:
  // Throw QSPipeException if buffer is null or shorter than lengthToRead
  StreamBuf(const Buffer &buf, size_t lengthToRead);

  ~StreamBuf() {}

  const Buffer &GetBuffer() const { return m_buffer; }
  size_t GetLength() const { return m_lengthToRead; }

 protected:
  pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                   std::ios_base::openmode which = std::ios_base::in |
                                                   std::ios_base::out);
  pos_type seekpos(pos_type pos,
                   std::ios_base::openmode which = std::ios_base::in |
                                                   std::ios_base::out);

 private:
  char *begin() { return &(*m_buffer)[0]; }
  char *end() { return begin() + m_lengthToRead; }

 private:
  Buffer m_buffer;
  size_t m_lengthToRead;  // length in bytes to actually use in the buffer
                          // e.g. you have a 5MB buffer, but only want
                          // stream to see 1MB of it.

  friend class IOStream;
  friend class StreamTest;
};

}  // namespace Data
}  // namespace QSPipe

#endif  // QSPIPE_DATA_STREAMBUF_H_
