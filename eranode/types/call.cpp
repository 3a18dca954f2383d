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

#include "call.hpp"

#include <string>

#include <eranode/common/util.hpp>

namespace eranode {

std::string to_string(CallType type) {
    switch (type) {
        case CallType::kCall: return "Call(Normal)";
        case CallType::kDelegateCall: return "Call(Delegate)";
        case CallType::kMimicCall: return "Call(Mimic)";
        case CallType::kCreate: return "Create";
        case CallType::kNearCall: return "NearCall";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& out, CallType type) {
    out << to_string(type);
    return out;
}

std::ostream& operator<<(std::ostream& out, const Call& call) {
    out << "type: " << call.type;
    out << " from: " << to_hex_address(call.from);
    out << " to: " << to_hex_address(call.to);
    out << " input: " << silkworm::to_hex(call.input);
    out << " gas_used: " << call.gas_used;
    if (call.revert_reason) {
        out << " revert_reason: " << *call.revert_reason;
    }
    if (call.error) {
        out << " error: " << *call.error;
    }
    out << " #calls: " << call.calls.size();
    return out;
}

} // namespace eranode
