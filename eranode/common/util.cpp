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

#include "util.hpp"

#include <optional>
#include <string>

namespace eranode {

std::string to_hex_address(const evmc::address& address) {
    return "0x" + silkworm::to_hex(address);
}

std::string to_hex_bytes32(const evmc::bytes32& b32) {
    return "0x" + silkworm::to_hex(b32);
}

std::string to_fixed_hex(const intx::uint256& value) {
    uint8_t bytes[32];
    intx::be::unsafe::store(bytes, value);
    return "0x" + silkworm::to_hex(silkworm::ByteView{bytes, sizeof(bytes)});
}

std::optional<std::string> function_selector_of(silkworm::ByteView input) {
    if (input.length() < kFunctionSelectorLength) {
        return std::nullopt;
    }
    return silkworm::to_hex(input.substr(0, kFunctionSelectorLength));
}

} // namespace eranode
