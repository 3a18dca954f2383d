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

#include "bytecode.hpp"

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <silkworm/common/endian.hpp>
#include <silkworm/common/util.hpp>

#include <eranode/common/log.hpp>

namespace eranode::system_contracts {

bool is_well_formed_bytecode(silkworm::ByteView bytecode) noexcept {
    if (bytecode.size() % kBytecodeWordSize != 0) {
        return false;
    }
    const auto words = bytecode.size() / kBytecodeWordSize;
    return words < kMaxBytecodeWords && words % 2 == 1;
}

evmc::bytes32 hash_bytecode(silkworm::ByteView bytecode) {
    if (bytecode.size() % kBytecodeWordSize != 0) {
        throw std::invalid_argument{"bytecode length in bytes must be divisible by 32: " + std::to_string(bytecode.size())};
    }
    const auto words = bytecode.size() / kBytecodeWordSize;
    if (words >= kMaxBytecodeWords) {
        throw std::invalid_argument{"bytecode too long in 32-byte words: " + std::to_string(words)};
    }
    if (words % 2 == 0) {
        throw std::invalid_argument{"bytecode length in 32-byte words must be odd: " + std::to_string(words)};
    }

    evmc::bytes32 hash;
    unsigned int digest_length{0};
    if (EVP_Digest(bytecode.data(), bytecode.size(), hash.bytes, &digest_length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error{"SHA-256 digest failed"};
    }
    hash.bytes[0] = kBytecodeHashVersion;
    hash.bytes[1] = 0;
    silkworm::endian::store_big_u16(&hash.bytes[2], static_cast<uint16_t>(words));
    return hash;
}

std::vector<intx::uint256> bytes_to_be_words(silkworm::ByteView bytes) {
    if (bytes.size() % kBytecodeWordSize != 0) {
        throw std::invalid_argument{"byte length must be divisible by 32: " + std::to_string(bytes.size())};
    }
    std::vector<intx::uint256> words;
    words.reserve(bytes.size() / kBytecodeWordSize);
    for (std::size_t offset{0}; offset < bytes.size(); offset += kBytecodeWordSize) {
        words.push_back(intx::be::unsafe::load<intx::uint256>(&bytes[offset]));
    }
    return words;
}

std::optional<silkworm::Bytes> bytecode_from_artifact(std::string_view artifact_json) {
    const auto json = nlohmann::json::parse(artifact_json, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object() || !json.contains("bytecode") || !json["bytecode"].is_string()) {
        ERANODE_ERROR << "bytecode_from_artifact missing bytecode field\n";
        return std::nullopt;
    }
    auto bytecode = silkworm::from_hex(json["bytecode"].get<std::string>());
    if (!bytecode) {
        ERANODE_ERROR << "bytecode_from_artifact bytecode field is not hex\n";
        return std::nullopt;
    }
    ERANODE_TRACE << "bytecode_from_artifact size: " << bytecode->size() << "\n";
    return bytecode;
}

} // namespace eranode::system_contracts
