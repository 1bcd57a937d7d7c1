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

#include "transfer/PartManifest.h"

#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/thread/locks.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "data/CompletedPart.h"

namespace QSPipe {

namespace Transfer {

using boost::lock_guard;
using boost::mutex;
using boost::to_string;
using QSPipe::Data::CompletedPart;
using QSPipe::Exception::SessionError;
using std::vector;

// --------------------------------------------------------------------------
PartManifest::PartManifest(int partCount)
    : m_slots(partCount > 0 ? partCount : 0), m_completedCount(0) {}

// --------------------------------------------------------------------------
bool PartManifest::Record(const CompletedPart &part) {
  int partNumber = part.GetPartNumber();
  lock_guard<mutex> lock(m_lock);
  if (partNumber < 1 || partNumber > static_cast<int>(m_slots.size())) {
    DebugError("Part number " << partNumber << " is out of range [1, "
               << m_slots.size() << "]");
    return false;
  }
  CompletedPart &slot = m_slots[partNumber - 1];
  if (!slot.IsEmpty()) {
    DebugWarning("Part " << partNumber << " is already recorded");
    return false;
  }
  slot = part;
  ++m_completedCount;
  return true;
}

// --------------------------------------------------------------------------
vector<CompletedPart> PartManifest::GetSortedParts() const {
  lock_guard<mutex> lock(m_lock);
  for (size_t i = 0; i < m_slots.size(); ++i) {
    if (m_slots[i].IsEmpty()) {
      throw SessionError("Part " + to_string(i + 1) + " of " +
                         to_string(m_slots.size()) + " is not uploaded");
    }
  }
  return m_slots;
}

// --------------------------------------------------------------------------
int PartManifest::GetCompletedCount() const {
  lock_guard<mutex> lock(m_lock);
  return m_completedCount;
}

// --------------------------------------------------------------------------
bool PartManifest::IsComplete() const {
  lock_guard<mutex> lock(m_lock);
  return m_completedCount == static_cast<int>(m_slots.size());
}

}  // namespace Transfer
}  // namespace QSPipe
