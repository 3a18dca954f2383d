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

#ifndef ERANODE_JSON_TYPES_HPP_
#define ERANODE_JSON_TYPES_HPP_

#include <string>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <eranode/types/call.hpp>
#include <eranode/types/event.hpp>
#include <eranode/types/execution_summary.hpp>
#include <eranode/types/storage_log.hpp>
#include <eranode/types/transaction_trace.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const address& addr);
void from_json(const nlohmann::json& json, address& addr);

void to_json(nlohmann::json& json, const bytes32& b32);
void from_json(const nlohmann::json& json, bytes32& b32);

} // namespace evmc

namespace intx {

void from_json(const nlohmann::json& json, uint256& ui256);

} // namespace intx

namespace eranode {

CallType call_type_from_string(const std::string& text);
StorageLogType storage_log_type_from_string(const std::string& text);

void from_json(const nlohmann::json& json, CallType& type);
void from_json(const nlohmann::json& json, Call& call);

void from_json(const nlohmann::json& json, VmEvent& event);

void from_json(const nlohmann::json& json, StorageLogType& log_type);
void from_json(const nlohmann::json& json, StorageLogQuery& query);

void from_json(const nlohmann::json& json, ExecutionSummary& summary);

void from_json(const nlohmann::json& json, TransactionTrace& trace);

//! Parse a trace dump holding either one transaction object or an array of them.
TransactionTraces parse_transaction_traces(const std::string& content);

} // namespace eranode

#endif  // ERANODE_JSON_TYPES_HPP_
