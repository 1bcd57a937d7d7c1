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

#ifndef QSPIPE_BASE_THREADPOOL_H_
#define QSPIPE_BASE_THREADPOOL_H_

#include <stddef.h>

#include <list>
#include <vector>

#include "boost/bind.hpp"
#include "boost/function.hpp"
#include "boost/move/move.hpp"
#include "boost/noncopyable.hpp"
#include "boost/preprocessor.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/utility/result_of.hpp"

//
// Macros for emulating Variadic Template in C++03
//
#define NUM_PARAMETERS 3
#define PARAMETERS(Z, N, D) \
  BOOST_PP_COMMA_IF(N)      \
  BOOST_FWD_REF(BOOST_PP_CAT(A, N)) BOOST_PP_CAT(a, N)
#define FORWARD(Z, N, D) \
  BOOST_PP_COMMA_IF(N)   \
  boost::forward<BOOST_PP_CAT(A, N)>(BOOST_PP_CAT(a, N))

namespace QSPipe {

namespace Transfer {
class UploadCoordinator;
}  // namespace Transfer

namespace Threading {

class TaskHandle;

typedef boost::function<void()> Task;

//
// ThreadPool
//
// A fixed number of worker threads consuming a shared task list in FIFO
// order. Workers are started by Initialize, and stopped and joined when the
// pool is destroyed; tasks still queued at that time are dropped.
//
class ThreadPool : private boost::noncopyable {
 public:
  explicit ThreadPool(size_t poolSize);
  ~ThreadPool();

 public:
  void SubmitToThread(const Task& task);

  size_t GetPoolSize() const { return m_poolSize; }

//
// Perfect Forward and Variadic Template Emulation in C++03
//
// Submit(f, args...) runs f(args...) on a worker thread.
// SubmitAsync(handler, f, args...) runs f(args...) on a worker thread and
// then calls handler(result, args...) on the same thread.
//
#define EXPAND(N)                                                          \
  template <typename F, BOOST_PP_ENUM_PARAMS(N, typename A)>               \
  void Submit(F f, BOOST_PP_REPEAT(N, PARAMETERS, ~)) {                    \
    typedef typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type \
        ReturnType;                                                        \
    SubmitToThread(boost::bind(boost::type<ReturnType>(), f,               \
                               BOOST_PP_REPEAT(N, FORWARD, ~)));           \
  }                                                                        \
                                                                           \
  template <typename ReceivedHandler, typename F,                          \
            BOOST_PP_ENUM_PARAMS(N, typename A)>                           \
  void SubmitAsync(ReceivedHandler handler, F f,                           \
                   BOOST_PP_REPEAT(N, PARAMETERS, ~)) {                    \
    typedef typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type \
        ReturnType;                                                        \
    SubmitToThread(                                                        \
        boost::bind(boost::type<void>(), handler,                          \
                    boost::bind(boost::type<ReturnType>(), f,              \
                                BOOST_PP_REPEAT(N, FORWARD, ~)),           \
                    BOOST_PP_REPEAT(N, FORWARD, ~)));                      \
  }

#define BOOST_PP_LOCAL_MACRO(N) EXPAND(N)
#define BOOST_PP_LOCAL_LIMITS (1, NUM_PARAMETERS)  // starting from 1
#include BOOST_PP_LOCAL_ITERATE()

#undef BOOST_PP_LOCAL_MACRO
#undef BOOST_PP_LOCAL_LIMITS
#undef EXPAND

 private:
  Task* PopTask();
  bool HasTasks();

  // Create the worker threads. Only get called once.
  void Initialize();

  // Stop all workers, no queued task will be handled since then.
  // Only used by destructor and interrupt test.
  void StopProcessing();

 private:
  size_t m_poolSize;
  std::list<Task*> m_tasks;
  boost::mutex m_queueLock;
  std::vector<TaskHandle*> m_taskHandles;
  boost::mutex m_syncLock;
  boost::condition_variable m_syncConditionVar;

  friend class TaskHandle;
  friend class ThreadPoolTest;
  friend class QSPipe::Transfer::UploadCoordinator;
};

}  // namespace Threading
}  // namespace QSPipe

#undef FORWARD
#undef PARAMETERS
#undef NUM_PARAMETERS

#endif  // QSPIPE_BASE_THREADPOOL_H_
