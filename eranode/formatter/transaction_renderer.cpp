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

#include "transaction_renderer.hpp"

#include <sstream>
#include <string>

#include <absl/strings/str_cat.h>

#include <eranode/common/terminal.hpp>
#include <eranode/common/util.hpp>
#include <eranode/formatter/call_trace_renderer.hpp>
#include <eranode/formatter/event_renderer.hpp>
#include <eranode/formatter/execution_summary_renderer.hpp>
#include <eranode/formatter/storage_log_renderer.hpp>

namespace eranode {

namespace {
    void append(Lines& lines, const Lines& other) {
        lines.insert(lines.end(), other.begin(), other.end());
    }

    std::string section_title(const std::string& title) {
        return absl::StrCat("==== ", terminal::bold(title));
    }
} // namespace

boost::asio::awaitable<Lines> render_transaction(const TransactionTrace& trace, const RenderOptions& options,
    const AddressDirectory& directory, resolver::SelectorResolver& resolver) {
    Lines lines;
    lines.push_back(absl::StrCat("Executing ", trace.transaction_hash ? to_hex_bytes32(*trace.transaction_hash) : "transaction"));

    if (options.show_vm_details != ShowVmDetails::None) {
        append(lines, render_execution_summary(trace.summary));
    }

    if (options.show_storage_logs != ShowStorageLogs::None) {
        lines.emplace_back("");
        lines.emplace_back("┌──────────────────┐");
        lines.emplace_back("│   STORAGE LOGS   │");
        lines.emplace_back("└──────────────────┘");
        append(lines, StorageLogRenderer{directory}.render(trace.storage_logs, options.show_storage_logs));
    }

    if (options.show_calls != ShowCalls::None) {
        std::stringstream title;
        title << options.show_calls << " calls";
        lines.emplace_back("");
        lines.push_back(section_title(title.str()));
        CallTraceRenderer call_renderer{directory, resolver, options.show_calls, options.resolve_hashes};
        append(lines, co_await call_renderer.render(trace.call));
    }

    lines.emplace_back("");
    lines.push_back(section_title(absl::StrCat(trace.events.size(), " events")));
    EventRenderer event_renderer{directory, resolver, options.resolve_hashes};
    append(lines, co_await event_renderer.render(trace.events));

    co_return lines;
}

} // namespace eranode
