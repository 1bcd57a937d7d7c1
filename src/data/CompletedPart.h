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

#ifndef QSPIPE_DATA_COMPLETEDPART_H_
#define QSPIPE_DATA_COMPLETEDPART_H_

#include <string>

namespace QSPipe {

namespace Data {

// A part stored by the backend, identified by its 1-based part number and
// the entity tag the backend returned for it.
class CompletedPart {
 public:
  CompletedPart() : m_partNumber(0) {}
  CompletedPart(int partNumber, const std::string &eTag)
      : m_partNumber(partNumber), m_eTag(eTag) {}

  int GetPartNumber() const { return m_partNumber; }
  const std::string &GetETag() const { return m_eTag; }

  // An empty part occupies a manifest slot not filled yet
  bool IsEmpty() const { return m_partNumber <= 0; }

 private:
  int m_partNumber;
  std::string m_eTag;
};

}  // namespace Data
}  // namespace QSPipe

#endif  // QSPIPE_DATA_COMPLETEDPART_H_
