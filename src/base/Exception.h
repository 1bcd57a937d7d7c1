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

#ifndef QSPIPE_BASE_EXCEPTION_H_
#define QSPIPE_BASE_EXCEPTION_H_

#include <stdexcept>
#include <string>

#include "boost/exception/to_string.hpp"

namespace QSPipe {

namespace Exception {

struct QSPipeException : public std::runtime_error {
  explicit QSPipeException(const std::string& msg) : std::runtime_error(msg) {}
  explicit QSPipeException(const char* msg)
      : std::runtime_error(std::string(msg)) {}
  virtual ~QSPipeException() throw() {}

  std::string get() const { return this->what(); }

  // Throw a copy of this exception with its most derived type.
  // Used to carry an error captured on a worker thread over to the
  // thread which reports it.
  virtual void Raise() const { throw *this; }
};

// Invalid or missing size, part size, concurrency or target arguments.
// Always raised before any remote call is made.
struct ConfigError : public QSPipeException {
  explicit ConfigError(const std::string& msg) : QSPipeException(msg) {}
  virtual void Raise() const { throw *this; }
};

// Input stream is shorter than declared, or reading from it failed.
struct InputError : public QSPipeException {
  explicit InputError(const std::string& msg) : QSPipeException(msg) {}
  virtual void Raise() const { throw *this; }
};

// The backend rejected or failed to store one part.
struct UploadError : public QSPipeException {
  UploadError(int partNumber, const std::string& backendError)
      : QSPipeException("Fail to upload part " +
                        boost::to_string(partNumber) + ": " + backendError),
        m_partNumber(partNumber),
        m_backendError(backendError) {}
  virtual ~UploadError() throw() {}
  virtual void Raise() const { throw *this; }

  int GetPartNumber() const { return m_partNumber; }
  const std::string& GetBackendError() const { return m_backendError; }

 private:
  int m_partNumber;
  std::string m_backendError;
};

// Opening, completing or otherwise driving the multipart session failed.
struct SessionError : public QSPipeException {
  explicit SessionError(const std::string& msg) : QSPipeException(msg) {}
  virtual void Raise() const { throw *this; }
};

}  // namespace Exception
}  // namespace QSPipe


#endif  // QSPIPE_BASE_EXCEPTION_H_
