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

#ifndef ERANODE_FORMATTER_ADDRESS_DIRECTORY_HPP_
#define ERANODE_FORMATTER_ADDRESS_DIRECTORY_HPP_

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

namespace eranode {

enum class ContractType {
    kSystem,
    kPrecompile,
    kPopular,
    kUnknown
};

std::string to_string(ContractType type);
std::ostream& operator<<(std::ostream& out, ContractType type);

struct KnownAddress {
    evmc::address address;
    std::string name;
    ContractType contract_type{ContractType::kUnknown};
};

void from_json(const nlohmann::json& json, ContractType& type);
void from_json(const nlohmann::json& json, KnownAddress& known_address);

//! Read-only directory of well-known addresses, built once and then shared by const reference.
class AddressDirectory {
  public:
    //! Parse an array of {address, name, contract_type} records; throws std::runtime_error on malformed input.
    static AddressDirectory load(std::string_view json_text);

    //! Load a user supplied address map file; throws std::runtime_error on missing file or malformed content.
    static AddressDirectory from_file(const std::filesystem::path& file_path);

    //! The address map embedded at build time.
    static AddressDirectory builtin();

    AddressDirectory() = default;

    AddressDirectory(const AddressDirectory&) = delete;
    AddressDirectory& operator=(const AddressDirectory&) = delete;

    AddressDirectory(AddressDirectory&&) = default;
    AddressDirectory& operator=(AddressDirectory&&) = default;

    const KnownAddress* find(const evmc::address& address) const;

    ContractType classify(const evmc::address& address) const;

    //! Styled name of the contract at address, if known.
    std::optional<std::string> known_name(const evmc::address& address) const;

    //! Styled name if known, otherwise the 0x-prefixed address.
    std::string display_name(const evmc::address& address) const;

    std::size_t size() const noexcept { return known_addresses_.size(); }

  private:
    std::map<evmc::address, KnownAddress> known_addresses_;
};

} // namespace eranode

#endif  // ERANODE_FORMATTER_ADDRESS_DIRECTORY_HPP_
