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

#include <catch2/catch.hpp>

#include <eranode/common/terminal.hpp>

namespace eranode {

TEST_CASE("render_execution_summary", "[eranode][formatter][execution_summary_renderer]") {
    ExecutionSummary summary{1024, 50000, 7, std::nullopt};

    SECTION("successful execution") {
        const auto lines = render_execution_summary(summary);
        REQUIRE(lines.size() == 8);
        CHECK(lines[0].empty());
        CHECK(lines[2] == "│   VM EXECUTION RESULTS   │");
        CHECK(lines[4] == "Cycles Used:          1024");
        CHECK(lines[5] == "Computation Gas Used: 50000");
        CHECK(lines[6] == "Contracts Used:       7");
        CHECK(lines[7] == "════════════════════════════");
        for (const auto& line : lines) {
            CHECK(line.find("Revert") == std::string::npos);
        }
    }

    SECTION("reverted execution") {
        summary.revert_reason = "Insufficient balance";
        const auto lines = render_execution_summary(summary);
        REQUIRE(lines.size() == 10);
        CHECK(lines[7].empty());
        CHECK(lines[8] == terminal::on_red("[!] Revert Reason:    Insufficient balance"));
        CHECK(lines[9] == "════════════════════════════");
    }
}

} // namespace eranode
