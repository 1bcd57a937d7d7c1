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

#include "client/Client.h"

#include "boost/shared_ptr.hpp"

#include "client/ClientImpl.h"

namespace QSPipe {

namespace Client {

using boost::shared_ptr;

// --------------------------------------------------------------------------
Client::Client(const shared_ptr<ClientImpl> &impl) : m_impl(impl) {}

// --------------------------------------------------------------------------
Client::~Client() {
  // do nothing
}

}  // namespace Client
}  // namespace QSPipe
