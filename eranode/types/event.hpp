/*
   Copyright 2023 The Eranode Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#ifndef ERANODE_TYPES_EVENT_HPP_
#define ERANODE_TYPES_EVENT_HPP_

#include <vector>

#include <evmc/evmc.hpp>

#include <silkworm/common/base.hpp>

namespace eranode {

struct VmEvent {
    evmc::address address;
    std::vector<evmc::bytes32> indexed_topics;
    silkworm::Bytes value;
};

typedef std::vector<VmEvent> VmEvents;

} // namespace eranode

#endif  // ERANODE_TYPES_EVENT_HPP_
