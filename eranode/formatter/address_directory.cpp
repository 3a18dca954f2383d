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

#include "address_directory.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <silkworm/common/assert.hpp>

#include <eranode/common/log.hpp>
#include <eranode/common/resources.hpp>
#include <eranode/common/terminal.hpp>
#include <eranode/common/util.hpp>
#include <eranode/json/types.hpp>

namespace eranode {

constexpr const char* kBuiltinAddressMap{"address_map.json"};

std::string to_string(ContractType type) {
    switch (type) {
        case ContractType::kSystem: return "System";
        case ContractType::kPrecompile: return "Precompile";
        case ContractType::kPopular: return "Popular";
        case ContractType::kUnknown: return "Unknown";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& out, ContractType type) {
    out << to_string(type);
    return out;
}

void from_json(const nlohmann::json& json, ContractType& type) {
    const auto text = json.get<std::string>();
    if (text == "System") {
        type = ContractType::kSystem;
    } else if (text == "Precompile") {
        type = ContractType::kPrecompile;
    } else if (text == "Popular") {
        type = ContractType::kPopular;
    } else if (text == "Unknown") {
        type = ContractType::kUnknown;
    } else {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "unknown contract type: " + text};
    }
}

void from_json(const nlohmann::json& json, KnownAddress& known_address) {
    known_address.address = json.at("address").get<evmc::address>();
    known_address.name = json.at("name").get<std::string>();
    known_address.contract_type = json.at("contract_type").get<ContractType>();
}

AddressDirectory AddressDirectory::load(std::string_view json_text) {
    std::vector<KnownAddress> records;
    try {
        const auto json = nlohmann::json::parse(json_text);
        if (!json.is_array()) {
            throw std::runtime_error{"malformed address map: top-level value is not an array"};
        }
        records = json.get<std::vector<KnownAddress>>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error{std::string{"malformed address map: "} + e.what()};
    } catch (const std::system_error& e) {
        throw std::runtime_error{std::string{"malformed address map: "} + e.what()};
    }

    AddressDirectory directory;
    for (auto& record : records) {
        // Later records override earlier ones for the same address
        const auto address = record.address;
        directory.known_addresses_.insert_or_assign(address, std::move(record));
    }
    ERANODE_DEBUG << "AddressDirectory::load known addresses: " << directory.size() << "\n";
    return directory;
}

AddressDirectory AddressDirectory::from_file(const std::filesystem::path& file_path) {
    std::ifstream file_stream{file_path};
    if (!file_stream) {
        throw std::runtime_error{"cannot open address map file: " + file_path.string()};
    }
    std::stringstream content;
    content << file_stream.rdbuf();
    ERANODE_INFO << "AddressDirectory loading address map from " << file_path.string() << "\n";
    return load(content.str());
}

AddressDirectory AddressDirectory::builtin() {
    const auto address_map = resources::find_text(kBuiltinAddressMap);
    SILKWORM_ASSERT(address_map.has_value());
    return load(*address_map);
}

const KnownAddress* AddressDirectory::find(const evmc::address& address) const {
    const auto it = known_addresses_.find(address);
    return it != known_addresses_.end() ? &it->second : nullptr;
}

ContractType AddressDirectory::classify(const evmc::address& address) const {
    const auto known_address = find(address);
    return known_address != nullptr ? known_address->contract_type : ContractType::kUnknown;
}

std::optional<std::string> AddressDirectory::known_name(const evmc::address& address) const {
    const auto known_address = find(address);
    if (known_address == nullptr) {
        return std::nullopt;
    }
    switch (known_address->contract_type) {
        case ContractType::kPrecompile:
            return terminal::dimmed(known_address->name);
        case ContractType::kPopular:
            return terminal::green(known_address->name);
        case ContractType::kSystem:
        case ContractType::kUnknown:
            return known_address->name;
    }
    return known_address->name;
}

std::string AddressDirectory::display_name(const evmc::address& address) const {
    return known_name(address).value_or(to_hex_address(address));
}

} // namespace eranode
