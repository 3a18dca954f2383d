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

#ifndef ERANODE_SYSTEM_CONTRACTS_BYTECODE_HPP_
#define ERANODE_SYSTEM_CONTRACTS_BYTECODE_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <silkworm/common/base.hpp>

namespace eranode::system_contracts {

constexpr std::size_t kBytecodeWordSize{32};
constexpr std::size_t kMaxBytecodeWords{1 << 16};
constexpr uint8_t kBytecodeHashVersion{1};

//! Whole number of words, odd word count and less than 2^16 words.
bool is_well_formed_bytecode(silkworm::ByteView bytecode) noexcept;

//! Versioned code hash: SHA-256 digest with version, zero and big-endian word count in the first 4 bytes.
//! Throws std::invalid_argument if bytecode is not well formed.
evmc::bytes32 hash_bytecode(silkworm::ByteView bytecode);

//! Split into big-endian 256-bit words; throws std::invalid_argument if not a whole number of words.
std::vector<intx::uint256> bytes_to_be_words(silkworm::ByteView bytes);

//! Bytecode held in the "bytecode" field of a compiled contract artifact, std::nullopt if malformed.
std::optional<silkworm::Bytes> bytecode_from_artifact(std::string_view artifact_json);

} // namespace eranode::system_contracts

#endif  // ERANODE_SYSTEM_CONTRACTS_BYTECODE_HPP_
