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

#ifndef ERANODE_FORMATTER_EXECUTION_SUMMARY_RENDERER_HPP_
#define ERANODE_FORMATTER_EXECUTION_SUMMARY_RENDERER_HPP_

#include <eranode/formatter/lines.hpp>
#include <eranode/types/execution_summary.hpp>

namespace eranode {

//! Boxed VM execution results, with the revert reason emphasized when present.
Lines render_execution_summary(const ExecutionSummary& summary);

void print_vm_details(const ExecutionSummary& summary);

} // namespace eranode

#endif  // ERANODE_FORMATTER_EXECUTION_SUMMARY_RENDERER_HPP_
