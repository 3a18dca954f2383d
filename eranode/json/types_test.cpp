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

#include <system_error>

#include <catch2/catch.hpp>
#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <eranode/common/log.hpp>

namespace eranode {

using Catch::Matchers::Message;
using evmc::literals::operator""_address, evmc::literals::operator""_bytes32;

TEST_CASE("serialize address", "[eranode][json][types]") {
    nlohmann::json j = 0xa872626373628737383927236382161739290870_address;
    CHECK(j == R"("0xa872626373628737383927236382161739290870")"_json);
}

TEST_CASE("deserialize address", "[eranode][json][types]") {
    SECTION("lowercase and checksummed") {
        const auto a1 = R"("0x000000000000000000000000000000000000800a")"_json.get<evmc::address>();
        CHECK(a1 == 0x000000000000000000000000000000000000800a_address);
        const auto a2 = R"("0x3355df6D4c9C3035724Fd0e3914dE96A5a83aaf4")"_json.get<evmc::address>();
        CHECK(a2 == 0x3355df6d4c9c3035724fd0e3914de96a5a83aaf4_address);
    }
    SECTION("wrong length") {
        CHECK_THROWS_AS(R"("0x800a")"_json.get<evmc::address>(), std::system_error);
    }
    SECTION("not hex") {
        CHECK_THROWS_AS(R"("0xzz0000000000000000000000000000000000800a")"_json.get<evmc::address>(), std::system_error);
    }
}

TEST_CASE("deserialize bytes32", "[eranode][json][types]") {
    const auto b32 = R"("0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef")"_json.get<evmc::bytes32>();
    CHECK(b32 == 0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32);
    CHECK_THROWS_AS(R"("0x1234")"_json.get<evmc::bytes32>(), std::system_error);
}

TEST_CASE("deserialize uint256", "[eranode][json][types]") {
    CHECK(R"("0x2a")"_json.get<intx::uint256>() == 42);
    CHECK(R"(42)"_json.get<intx::uint256>() == 42);
}

TEST_CASE("deserialize call type", "[eranode][json][types]") {
    CHECK(R"("Call(Normal)")"_json.get<CallType>() == CallType::kCall);
    CHECK(R"("Call(Delegate)")"_json.get<CallType>() == CallType::kDelegateCall);
    CHECK(R"("Call(Mimic)")"_json.get<CallType>() == CallType::kMimicCall);
    CHECK(R"("Create")"_json.get<CallType>() == CallType::kCreate);
    CHECK(R"("NearCall")"_json.get<CallType>() == CallType::kNearCall);
    CHECK_THROWS_MATCHES(R"("Jump")"_json.get<CallType>(), std::system_error, Message("unknown call type: Jump: Invalid argument"));
}

TEST_CASE("deserialize nested call", "[eranode][json][types]") {
    const auto json = R"({
        "type": "Call(Normal)",
        "from": "0x36615cf349d7f6344891b1e7ca7c72883f5dc049",
        "to": "0x0000000000000000000000000000000000008001",
        "input": "0x12345678ff",
        "gasUsed": "0x10",
        "revertReason": "out of gas",
        "calls": [
            {"type": "NearCall", "to": "0x0000000000000000000000000000000000008002", "gasUsed": 5},
            {"type": "Create", "to": "0x0000000000000000000000000000000000008006", "error": "boom", "calls": []}
        ]
    })"_json;
    const auto call = json.get<Call>();
    CHECK(call.type == CallType::kCall);
    CHECK(call.to == 0x0000000000000000000000000000000000008001_address);
    CHECK(call.input == silkworm::Bytes{0x12, 0x34, 0x56, 0x78, 0xff});
    CHECK(call.gas_used == 16);
    CHECK(call.revert_reason == "out of gas");
    CHECK(!call.error);
    REQUIRE(call.calls.size() == 2);
    CHECK(call.calls[0].type == CallType::kNearCall);
    CHECK(call.calls[0].gas_used == 5);
    CHECK(call.calls[1].error == "boom");
    CHECK(call.calls[1].failed());
}

TEST_CASE("deserialize storage log query", "[eranode][json][types]") {
    const auto json = R"({
        "logType": "InitialWrite",
        "address": "0x000000000000000000000000000000000000800a",
        "key": "0x01",
        "readValue": "0x00",
        "writtenValue": "0xff"
    })"_json;
    const auto query = json.get<StorageLogQuery>();
    CHECK(query.log_type == StorageLogType::kInitialWrite);
    CHECK(query.is_write());
    CHECK(query.key == 1);
    CHECK(query.written_value == 255);
    CHECK_THROWS_AS(R"({"logType": "Delete"})"_json.get<StorageLogQuery>(), std::system_error);
}

TEST_CASE("parse transaction traces", "[eranode][json][types]") {
    const std::string single{R"({
        "transactionHash": "0x3763e4f6e4198413383534c763f3f5dac5c5e939f0a81724e3beb96d6e2ad0d5",
        "call": {"to": "0x0000000000000000000000000000000000008001"},
        "events": [{
            "address": "0x000000000000000000000000000000000000800a",
            "indexedTopics": ["0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef"]
        }],
        "summary": {"cyclesUsed": 10, "computationalGasUsed": 20, "contractsUsed": 3, "revertReason": null}
    })"};

    SECTION("single object") {
        const auto traces = parse_transaction_traces(single);
        REQUIRE(traces.size() == 1);
        CHECK(traces[0].transaction_hash == 0x3763e4f6e4198413383534c763f3f5dac5c5e939f0a81724e3beb96d6e2ad0d5_bytes32);
        CHECK(traces[0].events.size() == 1);
        CHECK(traces[0].storage_logs.empty());
        CHECK(traces[0].summary.cycles_used == 10);
        CHECK(traces[0].summary.contracts_used == 3);
        CHECK(!traces[0].summary.revert_reason);
    }

    SECTION("array of objects") {
        const auto traces = parse_transaction_traces("[" + single + "," + single + "]");
        CHECK(traces.size() == 2);
    }

    SECTION("malformed document") {
        CHECK_THROWS_AS(parse_transaction_traces("{"), nlohmann::json::parse_error);
        CHECK_THROWS_AS(parse_transaction_traces("{}"), nlohmann::json::out_of_range);
    }
}

} // namespace eranode
