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

#ifndef ERANODE_TYPES_EXECUTION_SUMMARY_HPP_
#define ERANODE_TYPES_EXECUTION_SUMMARY_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace eranode {

struct ExecutionSummary {
    uint32_t cycles_used{0};
    uint32_t computational_gas_used{0};
    std::size_t contracts_used{0};
    std::optional<std::string> revert_reason;
};

} // namespace eranode

#endif  // ERANODE_TYPES_EXECUTION_SUMMARY_HPP_
