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

#ifndef ERANODE_FORMATTER_EVENT_RENDERER_HPP_
#define ERANODE_FORMATTER_EVENT_RENDERER_HPP_

#include <string>

#include <boost/asio/awaitable.hpp>

#include <eranode/formatter/address_directory.hpp>
#include <eranode/formatter/lines.hpp>
#include <eranode/resolver/selector_resolver.hpp>
#include <eranode/types/event.hpp>

namespace eranode {

class EventRenderer {
  public:
    EventRenderer(const AddressDirectory& directory, resolver::SelectorResolver& resolver, bool resolve_hashes)
        : directory_(directory), resolver_(resolver), resolve_hashes_(resolve_hashes) {}

    //! One line: emitter label followed by the comma separated topics.
    boost::asio::awaitable<std::string> render(const VmEvent& event);

    boost::asio::awaitable<Lines> render(const VmEvents& events);

  private:
    boost::asio::awaitable<std::string> render_topic(const evmc::bytes32& topic);

    std::string render_label(const evmc::address& address) const;

    const AddressDirectory& directory_;
    resolver::SelectorResolver& resolver_;
    bool resolve_hashes_;
};

boost::asio::awaitable<void> print_event(const VmEvent& event, const AddressDirectory& directory, resolver::SelectorResolver& resolver,
    bool resolve_hashes);

} // namespace eranode

#endif  // ERANODE_FORMATTER_EVENT_RENDERER_HPP_
