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

#ifndef ERANODE_RESOLVER_OPENCHAIN_RESOLVER_HPP_
#define ERANODE_RESOLVER_OPENCHAIN_RESOLVER_HPP_

#include <chrono>
#include <cstddef>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <evmc/evmc.hpp>

#include <eranode/common/constants.hpp>
#include <eranode/resolver/selector_resolver.hpp>

namespace eranode::resolver {

enum class SelectorKind {
    kFunction,
    kEvent
};

std::string to_string(SelectorKind kind);
std::ostream& operator<<(std::ostream& out, SelectorKind kind);

struct OpenChainSettings {
    std::string host{kDefaultOpenChainHost};
    std::string port{kDefaultOpenChainPort};
    std::chrono::milliseconds timeout{kDefaultTimeout};
};

//! Lowercase 0x-prefixed form of a selector given with or without prefix.
std::string normalize_selector(std::string_view selector);

//! HTTP target of the signature database lookup for the given selector.
std::string make_lookup_target(SelectorKind kind, const std::string& selector);

//! Extract the first signature name for selector from a lookup reply; std::nullopt if absent or malformed.
std::optional<std::string> parse_lookup_response(std::string_view body, SelectorKind kind, const std::string& selector);

//! Resolve host and port, failing with beast::error::timeout when not done within timeout.
boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve_endpoints(const std::string& host,
    const std::string& port, std::chrono::milliseconds timeout);

//! SelectorResolver querying the openchain.xyz signature database over HTTPS, caching every reply it gets.
class OpenChainResolver : public SelectorResolver {
  public:
    explicit OpenChainResolver(OpenChainSettings settings = {});

    OpenChainResolver(const OpenChainResolver&) = delete;
    OpenChainResolver& operator=(const OpenChainResolver&) = delete;

    boost::asio::awaitable<std::optional<std::string>> resolve_function_selector(std::string selector) override;
    boost::asio::awaitable<std::optional<std::string>> resolve_event_selector(evmc::bytes32 topic) override;

    std::size_t cache_size() const;

  protected:
    //! HTTPS GET of target on the configured host returning the reply body; throws on transport or HTTP errors.
    virtual boost::asio::awaitable<std::string> fetch(const std::string& target);

  private:
    boost::asio::awaitable<std::optional<std::string>> lookup(SelectorKind kind, const std::string& selector);

    std::optional<std::optional<std::string>> cached(const std::string& key) const;

    void store(const std::string& key, const std::optional<std::string>& name);

    OpenChainSettings settings_;
    boost::asio::ssl::context ssl_context_;
    mutable std::mutex cache_mutex_;
    std::map<std::string, std::optional<std::string>> cache_;
};

} // namespace eranode::resolver

#endif  // ERANODE_RESOLVER_OPENCHAIN_RESOLVER_HPP_
