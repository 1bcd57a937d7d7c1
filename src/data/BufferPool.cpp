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

#include "data/BufferPool.h"

#include <stddef.h>

#include <vector>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"

namespace QSPipe {

namespace Data {

using boost::bind;
using boost::lock_guard;
using boost::mutex;
using boost::to_string;
using boost::unique_lock;
using std::vector;

// --------------------------------------------------------------------------
BufferPool::BufferPool(size_t maxBuffers, size_t bufferSize)
    : m_maxBuffers(maxBuffers),
      m_bufferSize(bufferSize),
      m_allocated(0),
      m_inUse(0),
      m_shutdown(false) {
  FatalIf(maxBuffers == 0, "Buffer pool must hold at least one buffer");
}

// --------------------------------------------------------------------------
Buffer BufferPool::Acquire() {
  unique_lock<mutex> lock(m_lock);
  m_semaphore.wait(lock,
                   bind(boost::type<bool>(), &BufferPool::CanAcquire, this));

  if (m_shutdown) {
    DebugError("Trying to acquire buffer BUT buffer pool is shutdown");
    return Buffer();
  }

  Buffer buffer;
  if (!m_freeBuffers.empty()) {
    buffer = m_freeBuffers.back();
    m_freeBuffers.pop_back();
  } else {
    buffer = Buffer(new vector<char>(m_bufferSize));
    ++m_allocated;
    DebugInfo("Allocate buffer " << m_allocated << "/" << m_maxBuffers << " ["
              << to_string(m_bufferSize) << " bytes]");
  }
  ++m_inUse;
  return buffer;
}

// --------------------------------------------------------------------------
void BufferPool::Release(const Buffer &buffer) {
  if (!buffer) {
    return;
  }
  unique_lock<mutex> lock(m_lock);
  if (m_inUse == 0) {
    lock.unlock();
    DebugWarning("Releasing a buffer which is not acquired from pool");
    return;
  }
  m_freeBuffers.push_back(buffer);
  --m_inUse;
  lock.unlock();
  // wake up both a waiting acquisition and a waiting shutdown
  m_semaphore.notify_all();
}

// --------------------------------------------------------------------------
size_t BufferPool::ShutdownAndWait() {
  unique_lock<mutex> lock(m_lock);
  m_shutdown = true;
  m_semaphore.notify_all();  // unblock waiting acquisitions
  m_semaphore.wait(lock,
                   bind(boost::type<bool>(), &BufferPool::AllReleased, this));
  size_t count = m_freeBuffers.size();
  m_freeBuffers.clear();
  return count;
}

// --------------------------------------------------------------------------
bool BufferPool::BuffersAvailable() {
  lock_guard<mutex> lock(m_lock);
  return !m_shutdown && CanAcquire();
}

// --------------------------------------------------------------------------
bool BufferPool::IsShutdown() const {
  lock_guard<mutex> lock(m_lock);
  return m_shutdown;
}

// --------------------------------------------------------------------------
size_t BufferPool::GetAllocatedCount() {
  lock_guard<mutex> lock(m_lock);
  return m_allocated;
}

// --------------------------------------------------------------------------
size_t BufferPool::GetInUseCount() {
  lock_guard<mutex> lock(m_lock);
  return m_inUse;
}

// --------------------------------------------------------------------------
bool BufferPool::CanAcquire() const {
  return m_shutdown || !m_freeBuffers.empty() || m_allocated < m_maxBuffers;
}

}  // namespace Data
}  // namespace QSPipe
