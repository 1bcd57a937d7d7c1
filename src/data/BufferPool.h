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

#ifndef QSPIPE_DATA_BUFFERPOOL_H_
#define QSPIPE_DATA_BUFFERPOOL_H_

#include <stddef.h>  // for size_t

#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

namespace QSPipe {

namespace Data {

typedef boost::shared_ptr<std::vector<char> > Buffer;

/**
 * Bounded pool of fixed size buffers with Acquire/Release semantics.
 *
 * Buffers are allocated lazily, never more than the max buffer count.
 * Acquire will block waiting on an available buffer once all of them are
 * in use. Release will cause one blocked acquisition to unblock.
 * Call ShutdownAndWait when finished with the pool, this will unblock any
 * waiting acquisition and wait for all buffers to be returned.
 * After calling ShutdownAndWait, Acquire returns a null buffer.
 */
class BufferPool : private boost::noncopyable {
 public:
  BufferPool(size_t maxBuffers, size_t bufferSize);

  ~BufferPool() {}

 public:
  // Return a buffer with exclusive ownership
  //
  // @param  : void
  // @return : buffer of GetBufferSize() bytes, or null if pool is shutdown
  //
  // You must call Release on the buffer when you are finished
  // or other threads will block waiting to acquire it.
  Buffer Acquire();

  // Release a buffer back to the pool
  //
  // @param  : buffer
  // @return : void
  //
  // This will unblock one thread waiting Acquire call if any are waiting.
  void Release(const Buffer &buffer);

  // Waits for all acquired buffers to be released, then free them
  //
  // @param  : void
  // @return : count of buffers freed
  size_t ShutdownAndWait();

  // Return whether or not a buffer can be acquired without blocking
  //
  // This is only a hint to denote the availability at this instant.
  bool BuffersAvailable();

  bool IsShutdown() const;

  size_t GetMaxBuffers() const { return m_maxBuffers; }
  size_t GetBufferSize() const { return m_bufferSize; }
  size_t GetAllocatedCount();
  size_t GetInUseCount();

 private:
  // Predicate for waiting acquisition, called with lock held
  bool CanAcquire() const;
  // Predicate for shutdown, called with lock held
  bool AllReleased() const { return m_inUse == 0; }

 private:
  size_t m_maxBuffers;
  size_t m_bufferSize;
  size_t m_allocated;  // buffers created so far
  size_t m_inUse;      // buffers acquired and not released yet
  std::vector<Buffer> m_freeBuffers;
  bool m_shutdown;
  mutable boost::mutex m_lock;
  boost::condition_variable m_semaphore;

  friend class BufferPoolTest;
};

}  // namespace Data
}  // namespace QSPipe

#endif  // QSPIPE_DATA_BUFFERPOOL_H_
