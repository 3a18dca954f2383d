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

#include <catch2/catch.hpp>
#include <silkworm/common/base.hpp>
#include <silkworm/common/util.hpp>

#include <eranode/common/log.hpp>

namespace eranode {

using evmc::literals::operator""_address, evmc::literals::operator""_bytes32;

TEST_CASE("byte view from string", "[eranode][common][util]") {
    CHECK(silkworm::byte_view_of_string("").empty());
    CHECK(silkworm::byte_view_of_string("ab").length() == 2);
}

TEST_CASE("bytes from string", "[eranode][common][util]") {
    CHECK(silkworm::bytes_of_string("").empty());
    CHECK(silkworm::bytes_of_string("\x01\x02") == silkworm::Bytes{0x01, 0x02});
}

TEST_CASE("hex address has prefix and 40 digits", "[eranode][common][util]") {
    const auto address{0x000000000000000000000000000000000000800a_address};
    CHECK(to_hex_address(address) == "0x000000000000000000000000000000000000800a");
}

TEST_CASE("hex bytes32 has prefix and 64 digits", "[eranode][common][util]") {
    const auto topic{0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32};
    CHECK(to_hex_bytes32(topic) == "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef");
}

TEST_CASE("fixed hex of 256-bit word", "[eranode][common][util]") {
    CHECK(to_fixed_hex(intx::uint256{0}) == "0x0000000000000000000000000000000000000000000000000000000000000000");
    CHECK(to_fixed_hex(intx::uint256{0x2a}) == "0x000000000000000000000000000000000000000000000000000000000000002a");
    CHECK(to_fixed_hex(~intx::uint256{0}).length() == 66);
}

TEST_CASE("function selector of call input", "[eranode][common][util]") {
    SECTION("input with selector and arguments") {
        const silkworm::Bytes input{0xa9, 0x05, 0x9c, 0xbb, 0x00, 0x01};
        CHECK(function_selector_of(input) == "a9059cbb");
    }
    SECTION("input with exactly four bytes") {
        const silkworm::Bytes input{0x12, 0x34, 0x56, 0x78};
        CHECK(function_selector_of(input) == "12345678");
    }
    SECTION("input too short") {
        const silkworm::Bytes input{0x12, 0x34};
        CHECK(!function_selector_of(input));
        CHECK(!function_selector_of(silkworm::ByteView{}));
    }
}

TEST_CASE("print ByteView", "[eranode][common][util]") {
    silkworm::ByteView bv1{};
    CHECK_NOTHROW(null_stream() << bv1);
    silkworm::ByteView bv2{*silkworm::from_hex("0x0608")};
    CHECK_NOTHROW(null_stream() << bv2);
}

TEST_CASE("print address and bytes32", "[eranode][common][util]") {
    evmc::address addr{0xa872626373628737383927236382161739290870_address};
    CHECK_NOTHROW(null_stream() << addr);
    evmc::bytes32 b32{0x3763e4f6e4198413383534c763f3f5dac5c5e939f0a81724e3beb96d6e2ad0d5_bytes32};
    CHECK_NOTHROW(null_stream() << b32);
}

} // namespace eranode
