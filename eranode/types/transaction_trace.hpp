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

#ifndef ERANODE_TYPES_TRANSACTION_TRACE_HPP_
#define ERANODE_TYPES_TRANSACTION_TRACE_HPP_

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>

#include <eranode/types/call.hpp>
#include <eranode/types/event.hpp>
#include <eranode/types/execution_summary.hpp>
#include <eranode/types/storage_log.hpp>

namespace eranode {

//! Everything the VM reported for one executed transaction.
struct TransactionTrace {
    std::optional<evmc::bytes32> transaction_hash;
    Call call;
    VmEvents events;
    StorageLogQueries storage_logs;
    ExecutionSummary summary;
};

typedef std::vector<TransactionTrace> TransactionTraces;

} // namespace eranode

#endif  // ERANODE_TYPES_TRANSACTION_TRACE_HPP_
