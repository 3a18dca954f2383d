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

#ifndef ERANODE_COMMON_UTIL_HPP_
#define ERANODE_COMMON_UTIL_HPP_

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <silkworm/common/base.hpp>
#include <silkworm/common/util.hpp>

namespace eranode {

//! Length in bytes of a function selector, i.e. the leading bytes of call input data.
constexpr std::size_t kFunctionSelectorLength{4};

//! Hex representation of an address with 0x prefix.
std::string to_hex_address(const evmc::address& address);

//! Hex representation of a 32-byte value with 0x prefix.
std::string to_hex_bytes32(const evmc::bytes32& b32);

//! Zero-padded 0x-prefixed hex representation of a 256-bit word (66 characters).
std::string to_fixed_hex(const intx::uint256& value);

//! Hex digits (no prefix) of the selector leading the call input, or nullopt if input is too short.
std::optional<std::string> function_selector_of(silkworm::ByteView input);

} // namespace eranode

namespace silkworm {

inline ByteView byte_view_of_string(const std::string& s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.length()};
}

inline Bytes bytes_of_string(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

} // namespace silkworm

inline std::ostream& operator<<(std::ostream& out, const silkworm::ByteView& bytes) {
    for (const auto& b : bytes) {
        out << std::hex << std::setw(2) << std::setfill('0') << int(b);
    }
    out << std::dec;
    return out;
}

inline std::ostream& operator<<(std::ostream& out, const evmc::address& addr) {
    out << silkworm::to_hex(addr);
    return out;
}

inline std::ostream& operator<<(std::ostream& out, const evmc::bytes32& b32) {
    out << silkworm::to_hex(b32);
    return out;
}

#endif // ERANODE_COMMON_UTIL_HPP_
