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

#include "call_trace_renderer.hpp"

#include <utility>

#include <absl/strings/str_cat.h>
#include <silkworm/common/util.hpp>

#include <eranode/common/constants.hpp>
#include <eranode/common/log.hpp>
#include <eranode/common/terminal.hpp>
#include <eranode/common/util.hpp>

namespace eranode {

bool should_print(ContractType contract_type, ShowCalls show_calls) noexcept {
    switch (show_calls) {
        case ShowCalls::All:
            return true;
        case ShowCalls::None:
            return false;
        case ShowCalls::User:
        case ShowCalls::System:
            break;
    }
    switch (contract_type) {
        case ContractType::kUnknown:
        case ContractType::kPopular:
            return true;
        case ContractType::kPrecompile:
            return false;
        case ContractType::kSystem:
            return show_calls == ShowCalls::System;
    }
    return false;
}

boost::asio::awaitable<Lines> CallTraceRenderer::render(const Call& call) {
    Lines lines;
    co_await render_call(call, 0, lines);
    co_return lines;
}

boost::asio::awaitable<void> CallTraceRenderer::render_call(const Call& call, std::size_t padding, Lines& lines) {
    const auto contract_type = directory_.classify(call.to);
    if (should_print(contract_type, show_calls_)) {
        const auto function_signature = co_await render_function_signature(call, contract_type);
        const auto line = absl::StrCat(std::string(padding, ' '), to_string(call.type), " ",
            render_label(call.to), " ",
            function_signature, " ",
            call.revert_reason ? absl::StrCat("Revert: ", *call.revert_reason) : "", " ",
            call.error ? absl::StrCat("Error: ", *call.error) : "", " ",
            call.gas_used);
        lines.push_back(call.failed() ? terminal::on_red(line) : line);
    }
    for (const auto& subcall : call.calls) {
        co_await render_call(subcall, padding + kCallPaddingIncrement, lines);
    }
}

boost::asio::awaitable<std::string> CallTraceRenderer::render_function_signature(const Call& call, ContractType contract_type) {
    const auto selector = function_selector_of(call.input);
    if (!selector) {
        co_return "0x" + silkworm::to_hex(call.input);
    }
    if (resolve_hashes_ && contract_type != ContractType::kPrecompile) {
        const auto name = co_await resolver_.resolve_function_selector(*selector);
        if (name) {
            co_return *name;
        }
        ERANODE_DEBUG << "CallTraceRenderer unresolved function selector: " << *selector << "\n";
    }
    co_return terminal::pad_left(*selector, kFunctionSignatureWidth);
}

std::string CallTraceRenderer::render_label(const evmc::address& address) const {
    const auto known_name = directory_.known_name(address);
    if (known_name) {
        return terminal::pad_right(*known_name, kCallLabelWidth);
    }
    return terminal::pad_right(terminal::bold(to_hex_address(address)), kCallLabelWidth);
}

boost::asio::awaitable<void> print_call(const Call& call, const AddressDirectory& directory, resolver::SelectorResolver& resolver,
    ShowCalls show_calls, bool resolve_hashes) {
    CallTraceRenderer renderer{directory, resolver, show_calls, resolve_hashes};
    const auto lines = co_await renderer.render(call);
    print_lines(lines);
}

} // namespace eranode
