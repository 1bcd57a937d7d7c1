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

#ifndef QSPIPE_TRANSFER_SIZINGPOLICY_H_
#define QSPIPE_TRANSFER_SIZINGPOLICY_H_

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <utility>

#include "boost/function.hpp"

namespace QSPipe {

namespace Transfer {

// Calculate how many parts are needed to hold the input
//
// @param  : input size, part size in bytes
// @return : ceil(inputSize / partSize)
//
// Throw ConfigError if part size is 0.
uint64_t CalculatePartCount(uint64_t inputSize, uint64_t partSize);

// Parameters to pick a part size from.
//
// A zero part size means derive it from memory: either the memory limit,
// or the available system memory if no limit is given.
struct SizingRequest {
  uint64_t inputSize;      // in bytes
  uint64_t partSize;       // explicit part size in bytes, 0 if not given
  uint64_t memoryLimit;    // in bytes, 0 if not given
  uint64_t memoryReserve;  // in bytes, kept out of the budget
  size_t concurrency;

  SizingRequest()
      : inputSize(0),
        partSize(0),
        memoryLimit(0),
        memoryReserve(0),
        concurrency(1) {}
};

// Return available memory in bytes, or 0 and error message
typedef boost::function<std::pair<uint64_t, std::string>()> MemoryProbe;

//
// SizingPolicy
//
// Picks a part size which the backend accepts:
// min part size <= part size <= max part size, and the input fits in
// max part count parts.
//
class SizingPolicy {
 public:
  // Use the backend constraints and the system memory
  SizingPolicy();
  SizingPolicy(uint64_t minPartSize, uint64_t maxPartSize,
               uint32_t maxPartCount, const MemoryProbe &probe);

 public:
  // Calculate part size
  //
  // @param  : sizing request
  // @return : part size in bytes
  //
  // Throw ConfigError if input size or concurrency is 0, the explicit part
  // size is below min part size, there is no usable memory budget, or the
  // input cannot fit in max part count parts of max part size.
  uint64_t CalculatePartSize(const SizingRequest &request) const;

  uint64_t GetMinPartSize() const { return m_minPartSize; }
  uint64_t GetMaxPartSize() const { return m_maxPartSize; }
  uint32_t GetMaxPartCount() const { return m_maxPartCount; }

 private:
  uint64_t CalculateExplicitPartSize(uint64_t partSize) const;
  uint64_t CalculateMemoryPartSize(const SizingRequest &request) const;

  // Raise part size if input needs more than max part count parts
  uint64_t FitPartCount(uint64_t inputSize, uint64_t partSize) const;

 private:
  uint64_t m_minPartSize;
  uint64_t m_maxPartSize;
  uint32_t m_maxPartCount;
  MemoryProbe m_probe;
};

}  // namespace Transfer
}  // namespace QSPipe

#endif  // QSPIPE_TRANSFER_SIZINGPOLICY_H_
