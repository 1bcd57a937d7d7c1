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

#include "transfer/SizingPolicy.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <string>
#include <utility>

#include "boost/exception/to_string.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/Size.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace QSPipe {

namespace Transfer {

using boost::to_string;
using QSPipe::Configure::Default::GetUploadMultipartMaxPartCount;
using QSPipe::Configure::Default::GetUploadMultipartMaxPartSize;
using QSPipe::Configure::Default::GetUploadMultipartMinPartSize;
using QSPipe::Exception::ConfigError;
using QSPipe::Size::MB1;
using QSPipe::StringUtils::FormatSize;
using std::max;
using std::min;
using std::pair;
using std::string;

namespace {

uint64_t RoundDownToMB(uint64_t bytes) { return (bytes / MB1) * MB1; }

uint64_t RoundUpToMB(uint64_t bytes) {
  return ((bytes / MB1) + (bytes % MB1 == 0 ? 0 : 1)) * MB1;
}

}  // namespace

// --------------------------------------------------------------------------
uint64_t CalculatePartCount(uint64_t inputSize, uint64_t partSize) {
  if (partSize == 0) {
    throw ConfigError("Part size must be greater than 0");
  }
  return inputSize / partSize + (inputSize % partSize == 0 ? 0 : 1);
}

// --------------------------------------------------------------------------
SizingPolicy::SizingPolicy()
    : m_minPartSize(GetUploadMultipartMinPartSize()),
      m_maxPartSize(GetUploadMultipartMaxPartSize()),
      m_maxPartCount(GetUploadMultipartMaxPartCount()),
      m_probe(QSPipe::Utils::GetAvailableMemory) {}

// --------------------------------------------------------------------------
SizingPolicy::SizingPolicy(uint64_t minPartSize, uint64_t maxPartSize,
                           uint32_t maxPartCount, const MemoryProbe &probe)
    : m_minPartSize(minPartSize),
      m_maxPartSize(maxPartSize),
      m_maxPartCount(maxPartCount),
      m_probe(probe) {}

// --------------------------------------------------------------------------
uint64_t SizingPolicy::CalculatePartSize(const SizingRequest &request) const {
  if (request.inputSize == 0) {
    throw ConfigError("Input size must be greater than 0");
  }
  if (request.concurrency < 1) {
    throw ConfigError("Concurrency must be at least 1");
  }

  uint64_t partSize = request.partSize > 0
                          ? CalculateExplicitPartSize(request.partSize)
                          : CalculateMemoryPartSize(request);
  return FitPartCount(request.inputSize, partSize);
}

// --------------------------------------------------------------------------
uint64_t SizingPolicy::CalculateExplicitPartSize(uint64_t partSize) const {
  if (partSize < m_minPartSize) {
    throw ConfigError("Part size " + FormatSize(partSize) +
                      " is less than the minimum " +
                      FormatSize(m_minPartSize));
  }
  if (partSize > m_maxPartSize) {
    Warning("Part size " << FormatSize(partSize) << " exceeds the maximum "
            << FormatSize(m_maxPartSize) << ", use "
            << FormatSize(m_maxPartSize) << " instead");
    return m_maxPartSize;
  }
  return partSize;
}

// --------------------------------------------------------------------------
uint64_t SizingPolicy::CalculateMemoryPartSize(
    const SizingRequest &request) const {
  uint64_t budget = request.memoryLimit;
  if (budget == 0) {
    if (!m_probe) {
      throw ConfigError("Unable to get available memory");
    }
    pair<uint64_t, string> outcome = m_probe();
    if (outcome.first == 0) {
      throw ConfigError("Unable to get available memory: " + outcome.second +
                        ", please specify part size or memory limit");
    }
    budget = outcome.first;
    DebugInfo("Available memory " << FormatSize(budget));
  }

  if (budget <= request.memoryReserve) {
    throw ConfigError("Memory budget " + FormatSize(budget) +
                      " is not more than the reserved " +
                      FormatSize(request.memoryReserve) +
                      ", please specify part size");
  }

  // concurrency buffers in flight plus one being filled by reader
  uint64_t buffers = static_cast<uint64_t>(request.concurrency) + 1;
  uint64_t partSize = RoundDownToMB((budget - request.memoryReserve) / buffers);
  partSize = min(max(partSize, m_minPartSize), m_maxPartSize);
  Info("Derive part size " << FormatSize(partSize) << " from memory budget "
       << FormatSize(budget - request.memoryReserve) << " for "
       << buffers << " buffers");
  return partSize;
}

// --------------------------------------------------------------------------
uint64_t SizingPolicy::FitPartCount(uint64_t inputSize,
                                    uint64_t partSize) const {
  if (CalculatePartCount(inputSize, partSize) <= m_maxPartCount) {
    return partSize;
  }

  uint64_t needed =
      RoundUpToMB(CalculatePartCount(inputSize, m_maxPartCount));
  if (needed > m_maxPartSize) {
    throw ConfigError("Input of " + FormatSize(inputSize) +
                      " cannot fit in " + to_string(m_maxPartCount) +
                      " parts of at most " + FormatSize(m_maxPartSize));
  }
  Warning("Input of " << FormatSize(inputSize) << " needs more than "
          << m_maxPartCount << " parts of " << FormatSize(partSize)
          << ", raise part size to " << FormatSize(needed));
  return needed;
}

}  // namespace Transfer
}  // namespace QSPipe
