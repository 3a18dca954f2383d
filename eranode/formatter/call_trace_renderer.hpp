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

#ifndef ERANODE_FORMATTER_CALL_TRACE_RENDERER_HPP_
#define ERANODE_FORMATTER_CALL_TRACE_RENDERER_HPP_

#include <cstddef>
#include <string>

#include <boost/asio/awaitable.hpp>

#include <eranode/formatter/address_directory.hpp>
#include <eranode/formatter/lines.hpp>
#include <eranode/resolver/selector_resolver.hpp>
#include <eranode/types/call.hpp>
#include <eranode/types/show_options.hpp>

namespace eranode {

//! Visibility of a call to a contract of the given type under the display mode.
bool should_print(ContractType contract_type, ShowCalls show_calls) noexcept;

class CallTraceRenderer {
  public:
    CallTraceRenderer(const AddressDirectory& directory, resolver::SelectorResolver& resolver, ShowCalls show_calls, bool resolve_hashes)
        : directory_(directory), resolver_(resolver), show_calls_(show_calls), resolve_hashes_(resolve_hashes) {}

    CallTraceRenderer(const CallTraceRenderer&) = delete;
    CallTraceRenderer& operator=(const CallTraceRenderer&) = delete;

    //! Render the visible calls of the tree rooted at call in pre-order, one line each.
    boost::asio::awaitable<Lines> render(const Call& call);

  private:
    boost::asio::awaitable<void> render_call(const Call& call, std::size_t padding, Lines& lines);

    boost::asio::awaitable<std::string> render_function_signature(const Call& call, ContractType contract_type);

    std::string render_label(const evmc::address& address) const;

    const AddressDirectory& directory_;
    resolver::SelectorResolver& resolver_;
    ShowCalls show_calls_;
    bool resolve_hashes_;
};

boost::asio::awaitable<void> print_call(const Call& call, const AddressDirectory& directory, resolver::SelectorResolver& resolver,
    ShowCalls show_calls, bool resolve_hashes);

} // namespace eranode

#endif  // ERANODE_FORMATTER_CALL_TRACE_RENDERER_HPP_
