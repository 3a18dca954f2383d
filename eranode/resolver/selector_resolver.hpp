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

#ifndef ERANODE_RESOLVER_SELECTOR_RESOLVER_HPP_
#define ERANODE_RESOLVER_SELECTOR_RESOLVER_HPP_

#include <optional>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <evmc/evmc.hpp>

namespace eranode::resolver {

//! Best-effort lookup of human readable signatures. Implementations never throw: any failure yields std::nullopt.
class SelectorResolver {
  public:
    virtual ~SelectorResolver() = default;

    //! Resolve a 4-byte function selector given as hex digits, with or without 0x prefix.
    virtual boost::asio::awaitable<std::optional<std::string>> resolve_function_selector(std::string selector) = 0;

    //! Resolve a 32-byte event topic.
    virtual boost::asio::awaitable<std::optional<std::string>> resolve_event_selector(evmc::bytes32 topic) = 0;
};

} // namespace eranode::resolver

#endif  // ERANODE_RESOLVER_SELECTOR_RESOLVER_HPP_
