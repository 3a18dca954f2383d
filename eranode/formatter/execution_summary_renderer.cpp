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

#include "execution_summary_renderer.hpp"

#include <absl/strings/str_cat.h>

#include <eranode/common/terminal.hpp>

namespace eranode {

Lines render_execution_summary(const ExecutionSummary& summary) {
    Lines lines{
        "",
        "┌──────────────────────────┐",
        "│   VM EXECUTION RESULTS   │",
        "└──────────────────────────┘",
        absl::StrCat("Cycles Used:          ", summary.cycles_used),
        absl::StrCat("Computation Gas Used: ", summary.computational_gas_used),
        absl::StrCat("Contracts Used:       ", summary.contracts_used),
    };
    if (summary.revert_reason) {
        lines.emplace_back("");
        lines.push_back(terminal::on_red(absl::StrCat("[!] Revert Reason:    ", *summary.revert_reason)));
    }
    lines.emplace_back("════════════════════════════");
    return lines;
}

void print_vm_details(const ExecutionSummary& summary) {
    print_lines(render_execution_summary(summary));
}

} // namespace eranode
