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

#include "event_renderer.hpp"

#include <vector>

#include <absl/strings/str_join.h>

#include <eranode/common/constants.hpp>
#include <eranode/common/log.hpp>
#include <eranode/common/terminal.hpp>
#include <eranode/common/util.hpp>

namespace eranode {

boost::asio::awaitable<std::string> EventRenderer::render(const VmEvent& event) {
    std::vector<std::string> topics;
    topics.reserve(event.indexed_topics.size());
    for (const auto& topic : event.indexed_topics) {
        topics.push_back(co_await render_topic(topic));
    }
    co_return render_label(event.address) + " " + absl::StrJoin(topics, kTopicSeparator);
}

std::string EventRenderer::render_label(const evmc::address& address) const {
    const auto name = directory_.display_name(address);
    // precompile and popular names carry their own style
    const auto contract_type = directory_.classify(address);
    if (contract_type == ContractType::kPrecompile || contract_type == ContractType::kPopular) {
        return terminal::pad_right(name, kEventLabelWidth);
    }
    return terminal::pad_right(terminal::blue(name), kEventLabelWidth);
}

boost::asio::awaitable<Lines> EventRenderer::render(const VmEvents& events) {
    Lines lines;
    lines.reserve(events.size());
    for (const auto& event : events) {
        lines.push_back(co_await render(event));
    }
    co_return lines;
}

boost::asio::awaitable<std::string> EventRenderer::render_topic(const evmc::bytes32& topic) {
    if (resolve_hashes_) {
        const auto name = co_await resolver_.resolve_event_selector(topic);
        if (name) {
            co_return *name;
        }
        ERANODE_DEBUG << "EventRenderer unresolved topic: " << to_hex_bytes32(topic) << "\n";
    }
    co_return to_hex_bytes32(topic);
}

boost::asio::awaitable<void> print_event(const VmEvent& event, const AddressDirectory& directory, resolver::SelectorResolver& resolver,
    bool resolve_hashes) {
    EventRenderer renderer{directory, resolver, resolve_hashes};
    const auto line = co_await renderer.render(event);
    ERANODE_INFO << line << "\n";
}

} // namespace eranode
