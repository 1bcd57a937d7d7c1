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

#ifndef QSPIPE_TRANSFER_PARTMANIFEST_H_
#define QSPIPE_TRANSFER_PARTMANIFEST_H_

#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/thread/mutex.hpp"

#include "data/CompletedPart.h"

namespace QSPipe {

namespace Transfer {

//
// PartManifest
//
// Completed parts of a session, one slot per expected part in part number
// order. Workers may record in any order, a slot is written only once.
//
class PartManifest : private boost::noncopyable {
 public:
  explicit PartManifest(int partCount);

 public:
  // Record a completed part
  //
  // @param  : completed part
  // @return : false if part number is out of range or already recorded
  bool Record(const QSPipe::Data::CompletedPart &part);

  // Get all parts sorted by part number
  //
  // Throw SessionError if any part is not recorded yet.
  std::vector<QSPipe::Data::CompletedPart> GetSortedParts() const;

  int GetPartCount() const { return static_cast<int>(m_slots.size()); }
  int GetCompletedCount() const;
  bool IsComplete() const;

 private:
  std::vector<QSPipe::Data::CompletedPart> m_slots;  // index = part number - 1
  int m_completedCount;
  mutable boost::mutex m_lock;
};

}  // namespace Transfer
}  // namespace QSPipe

#endif  // QSPIPE_TRANSFER_PARTMANIFEST_H_
