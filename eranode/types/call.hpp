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

#ifndef ERANODE_TYPES_CALL_HPP_
#define ERANODE_TYPES_CALL_HPP_

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>

#include <silkworm/common/base.hpp>

namespace eranode {

enum class CallType {
    kCall,
    kDelegateCall,
    kMimicCall,
    kCreate,
    kNearCall
};

std::string to_string(CallType type);

//! One frame of the VM call stack, children in call order.
struct Call {
    CallType type{CallType::kCall};
    evmc::address from;
    evmc::address to;
    silkworm::Bytes input;
    uint64_t gas_used{0};
    std::optional<std::string> revert_reason;
    std::optional<std::string> error;
    std::vector<Call> calls;

    bool failed() const noexcept { return revert_reason.has_value() || error.has_value(); }
};

std::ostream& operator<<(std::ostream& out, CallType type);
std::ostream& operator<<(std::ostream& out, const Call& call);

} // namespace eranode

#endif  // ERANODE_TYPES_CALL_HPP_
