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

#include "types.hpp"

#include <string>
#include <system_error>
#include <utility>

#include <silkworm/common/util.hpp>

#include <eranode/common/log.hpp>
#include <eranode/common/util.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const address& addr) {
    json = eranode::to_hex_address(addr);
}

void from_json(const nlohmann::json& json, address& addr) {
    const auto address_bytes = silkworm::from_hex(json.get<std::string>());
    if (!address_bytes || address_bytes->length() != silkworm::kAddressLength) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid address: " + json.dump()};
    }
    addr = silkworm::to_evmc_address(*address_bytes);
}

void to_json(nlohmann::json& json, const bytes32& b32) {
    json = eranode::to_hex_bytes32(b32);
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    const auto b32_bytes = silkworm::from_hex(json.get<std::string>());
    if (!b32_bytes || b32_bytes->length() != silkworm::kHashLength) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid bytes32: " + json.dump()};
    }
    b32 = silkworm::to_bytes32(*b32_bytes);
}

} // namespace evmc

namespace intx {

void from_json(const nlohmann::json& json, uint256& ui256) {
    if (json.is_number_unsigned()) {
        ui256 = json.get<uint64_t>();
    } else {
        ui256 = intx::from_string<intx::uint256>(json.get<std::string>());
    }
}

} // namespace intx

namespace eranode {

namespace {
    uint64_t quantity_from_json(const nlohmann::json& json) {
        if (json.is_string()) {
            return std::stoull(json.get<std::string>(), nullptr, 16);
        }
        return json.get<uint64_t>();
    }

    std::optional<std::string> optional_string(const nlohmann::json& json, const char* key) {
        if (json.count(key) == 0 || json.at(key).is_null()) {
            return std::nullopt;
        }
        return json.at(key).get<std::string>();
    }
} // namespace

CallType call_type_from_string(const std::string& text) {
    if (text == "Call(Normal)" || text == "Call") {
        return CallType::kCall;
    }
    if (text == "Call(Delegate)" || text == "DelegateCall") {
        return CallType::kDelegateCall;
    }
    if (text == "Call(Mimic)" || text == "MimicCall") {
        return CallType::kMimicCall;
    }
    if (text == "Create") {
        return CallType::kCreate;
    }
    if (text == "NearCall") {
        return CallType::kNearCall;
    }
    throw std::system_error{std::make_error_code(std::errc::invalid_argument), "unknown call type: " + text};
}

StorageLogType storage_log_type_from_string(const std::string& text) {
    if (text == "Read") {
        return StorageLogType::kRead;
    }
    if (text == "InitialWrite") {
        return StorageLogType::kInitialWrite;
    }
    if (text == "RepeatedWrite") {
        return StorageLogType::kRepeatedWrite;
    }
    throw std::system_error{std::make_error_code(std::errc::invalid_argument), "unknown storage log type: " + text};
}

void from_json(const nlohmann::json& json, CallType& type) {
    type = call_type_from_string(json.get<std::string>());
}

void from_json(const nlohmann::json& json, Call& call) {
    if (json.count("type") != 0) {
        call.type = json.at("type").get<CallType>();
    }
    if (json.count("from") != 0) {
        call.from = json.at("from").get<evmc::address>();
    }
    call.to = json.at("to").get<evmc::address>();
    if (json.count("input") != 0) {
        const auto json_input = json.at("input").get<std::string>();
        const auto input = silkworm::from_hex(json_input);
        if (!input) {
            throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid call input: " + json_input};
        }
        call.input = *input;
    }
    if (json.count("gasUsed") != 0) {
        call.gas_used = quantity_from_json(json.at("gasUsed"));
    }
    call.revert_reason = optional_string(json, "revertReason");
    call.error = optional_string(json, "error");
    if (json.count("calls") != 0) {
        call.calls = json.at("calls").get<std::vector<Call>>();
    }
}

void from_json(const nlohmann::json& json, VmEvent& event) {
    event.address = json.at("address").get<evmc::address>();
    if (json.count("indexedTopics") != 0) {
        event.indexed_topics = json.at("indexedTopics").get<std::vector<evmc::bytes32>>();
    }
    if (json.count("value") != 0) {
        const auto value = silkworm::from_hex(json.at("value").get<std::string>());
        event.value = value.value_or(silkworm::Bytes{});
    }
}

void from_json(const nlohmann::json& json, StorageLogType& log_type) {
    log_type = storage_log_type_from_string(json.get<std::string>());
}

void from_json(const nlohmann::json& json, StorageLogQuery& query) {
    query.log_type = json.at("logType").get<StorageLogType>();
    query.address = json.at("address").get<evmc::address>();
    query.key = json.at("key").get<intx::uint256>();
    query.read_value = json.at("readValue").get<intx::uint256>();
    if (json.count("writtenValue") != 0) {
        query.written_value = json.at("writtenValue").get<intx::uint256>();
    }
}

void from_json(const nlohmann::json& json, ExecutionSummary& summary) {
    summary.cycles_used = json.at("cyclesUsed").get<uint32_t>();
    summary.computational_gas_used = json.at("computationalGasUsed").get<uint32_t>();
    summary.contracts_used = json.at("contractsUsed").get<std::size_t>();
    summary.revert_reason = optional_string(json, "revertReason");
}

void from_json(const nlohmann::json& json, TransactionTrace& trace) {
    if (json.count("transactionHash") != 0) {
        trace.transaction_hash = json.at("transactionHash").get<evmc::bytes32>();
    }
    trace.call = json.at("call").get<Call>();
    if (json.count("events") != 0) {
        trace.events = json.at("events").get<VmEvents>();
    }
    if (json.count("storageLogs") != 0) {
        trace.storage_logs = json.at("storageLogs").get<StorageLogQueries>();
    }
    if (json.count("summary") != 0) {
        trace.summary = json.at("summary").get<ExecutionSummary>();
    }
}

TransactionTraces parse_transaction_traces(const std::string& content) {
    const auto json = nlohmann::json::parse(content);
    ERANODE_TRACE << "parse_transaction_traces json: " << json.dump() << "\n";
    if (json.is_array()) {
        return json.get<TransactionTraces>();
    }
    return TransactionTraces{json.get<TransactionTrace>()};
}

} // namespace eranode
