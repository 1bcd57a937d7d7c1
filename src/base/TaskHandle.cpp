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

#include "base/TaskHandle.h"

#include <exception>

#include "boost/bind.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/shared_mutex.hpp"

#include "base/LogMacros.h"
#include "base/ThreadPool.h"

namespace QSPipe {

namespace Threading {

using boost::lock_guard;
using boost::mutex;
using boost::scoped_ptr;
using boost::shared_lock;
using boost::shared_mutex;
using boost::unique_lock;

// --------------------------------------------------------------------------
TaskHandle::TaskHandle(ThreadPool& threadPool)
    : m_continue(true),
      m_threadPool(threadPool),
      m_thread(boost::bind(boost::type<void>(), &TaskHandle::operator(),
                           this)) {}

// --------------------------------------------------------------------------
TaskHandle::~TaskHandle() {
  Stop();
  {
    lock_guard<mutex> lock(m_threadPool.m_syncLock);
    m_threadPool.m_syncConditionVar.notify_all();
  }
  if (m_thread.joinable()) {
    m_thread.join();
  }
}

// --------------------------------------------------------------------------
void TaskHandle::Stop() {
  lock_guard<shared_mutex> lock(m_continueLock);
  m_continue = false;
}

// --------------------------------------------------------------------------
bool TaskHandle::ShouldContinue() const {
  shared_lock<shared_mutex> lock(m_continueLock);
  return m_continue;
}

// --------------------------------------------------------------------------
void TaskHandle::operator()() {
  while (ShouldContinue()) {
    while (ShouldContinue() && m_threadPool.HasTasks()) {
      scoped_ptr<Task> task(m_threadPool.PopTask());
      if (!task) {
        continue;
      }
      try {
        (*task)();
      } catch (const std::exception& err) {
        // a throwing task must not take the worker thread down
        Error("Uncaught exception in worker thread: " << err.what());
      }
    }

    unique_lock<mutex> lock(m_threadPool.m_syncLock);
    m_threadPool.m_syncConditionVar.wait(
        lock, boost::bind(boost::type<bool>(), &TaskHandle::Predicate, this));
  }
}

// --------------------------------------------------------------------------
bool TaskHandle::Predicate() const {
  return !ShouldContinue() || m_threadPool.HasTasks();
}

}  // namespace Threading
}  // namespace QSPipe
