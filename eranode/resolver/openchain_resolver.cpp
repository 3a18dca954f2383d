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

#include "openchain_resolver.hpp"

#include <cctype>
#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <eranode/common/log.hpp>
#include <eranode/common/util.hpp>

namespace eranode::resolver {

namespace beast = boost::beast;
namespace http = boost::beast::http;

constexpr const char* kUserAgent{"eranode"};
constexpr int kHttpVersion{11};

std::string to_string(SelectorKind kind) {
    switch (kind) {
        case SelectorKind::kFunction: return "function";
        case SelectorKind::kEvent: return "event";
    }
    return "function";
}

std::ostream& operator<<(std::ostream& out, SelectorKind kind) {
    out << to_string(kind);
    return out;
}

std::string normalize_selector(std::string_view selector) {
    if (selector.size() >= 2 && selector[0] == '0' && (selector[1] == 'x' || selector[1] == 'X')) {
        selector.remove_prefix(2);
    }
    std::string normalized{"0x"};
    normalized.reserve(2 + selector.size());
    for (const auto c : selector) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return normalized;
}

std::string make_lookup_target(SelectorKind kind, const std::string& selector) {
    return std::string{kOpenChainLookupTarget} + "?" + to_string(kind) + "=" + normalize_selector(selector) + "&filter=true";
}

std::optional<std::string> parse_lookup_response(std::string_view body, SelectorKind kind, const std::string& selector) {
    const auto json = nlohmann::json::parse(body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        ERANODE_DEBUG << "parse_lookup_response invalid reply: " << body << "\n";
        return std::nullopt;
    }
    if (!json.contains("ok") || !json["ok"].is_boolean() || !json["ok"].get<bool>()) {
        ERANODE_DEBUG << "parse_lookup_response failed reply: " << body << "\n";
        return std::nullopt;
    }
    const auto result_it = json.find("result");
    if (result_it == json.end() || !result_it->is_object()) {
        return std::nullopt;
    }
    const auto kind_it = result_it->find(to_string(kind));
    if (kind_it == result_it->end() || !kind_it->is_object()) {
        return std::nullopt;
    }
    const auto signatures_it = kind_it->find(normalize_selector(selector));
    if (signatures_it == kind_it->end() || !signatures_it->is_array() || signatures_it->empty()) {
        return std::nullopt;
    }
    const auto& first_signature = signatures_it->front();
    if (!first_signature.is_object() || !first_signature.contains("name") || !first_signature["name"].is_string()) {
        return std::nullopt;
    }
    return first_signature["name"].get<std::string>();
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve_endpoints(const std::string& host,
    const std::string& port, std::chrono::milliseconds timeout) {
    auto executor = co_await boost::asio::this_coro::executor;

    auto tcp_resolver = std::make_shared<boost::asio::ip::tcp::resolver>(executor);
    boost::asio::steady_timer deadline{executor};
    deadline.expires_after(timeout);
    deadline.async_wait([tcp_resolver](const boost::system::error_code& ec) {
        if (!ec) {
            tcp_resolver->cancel();
        }
    });

    boost::system::error_code ec;
    auto endpoints = co_await tcp_resolver->async_resolve(host, port, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    deadline.cancel();
    if (ec == boost::asio::error::operation_aborted) {
        throw boost::system::system_error{beast::error::timeout};
    }
    if (ec) {
        throw boost::system::system_error{ec};
    }
    co_return endpoints;
}

OpenChainResolver::OpenChainResolver(OpenChainSettings settings)
    : settings_{std::move(settings)}, ssl_context_{boost::asio::ssl::context::tls_client} {
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(boost::asio::ssl::verify_peer);
    ssl_context_.set_verify_callback(boost::asio::ssl::host_name_verification(settings_.host));
    ERANODE_DEBUG << "OpenChainResolver::OpenChainResolver host: " << settings_.host << " port: " << settings_.port
        << " timeout: " << settings_.timeout.count() << "ms\n";
}

boost::asio::awaitable<std::optional<std::string>> OpenChainResolver::resolve_function_selector(std::string selector) {
    co_return co_await lookup(SelectorKind::kFunction, selector);
}

boost::asio::awaitable<std::optional<std::string>> OpenChainResolver::resolve_event_selector(evmc::bytes32 topic) {
    const auto selector = to_hex_bytes32(topic);
    co_return co_await lookup(SelectorKind::kEvent, selector);
}

std::size_t OpenChainResolver::cache_size() const {
    std::lock_guard lock{cache_mutex_};
    return cache_.size();
}

boost::asio::awaitable<std::optional<std::string>> OpenChainResolver::lookup(SelectorKind kind, const std::string& selector) {
    const auto normalized_selector = normalize_selector(selector);
    const auto key = to_string(kind) + ":" + normalized_selector;
    if (const auto cached_name = cached(key)) {
        ERANODE_TRACE << "OpenChainResolver::lookup cache hit " << key << "\n";
        co_return *cached_name;
    }

    std::optional<std::string> name;
    try {
        const auto target = make_lookup_target(kind, normalized_selector);
        ERANODE_DEBUG << "OpenChainResolver::lookup GET " << settings_.host << target << "\n";
        const auto body = co_await fetch(target);
        name = parse_lookup_response(body, kind, normalized_selector);
    } catch (const boost::system::system_error& se) {
        ERANODE_WARN << "OpenChainResolver::lookup " << key << " failed: " << se.code().message() << "\n";
        co_return std::nullopt;
    } catch (const std::exception& e) {
        ERANODE_WARN << "OpenChainResolver::lookup " << key << " failed: " << e.what() << "\n";
        co_return std::nullopt;
    }

    ERANODE_DEBUG << "OpenChainResolver::lookup " << key << " resolved: " << name.value_or("<none>") << "\n";
    store(key, name);
    co_return name;
}

boost::asio::awaitable<std::string> OpenChainResolver::fetch(const std::string& target) {
    auto executor = co_await boost::asio::this_coro::executor;

    beast::ssl_stream<beast::tcp_stream> stream{executor, ssl_context_};

    // SNI is mandatory for most HTTPS front-ends
    if (!SSL_set_tlsext_host_name(stream.native_handle(), settings_.host.c_str())) {
        throw boost::system::system_error{
            boost::system::error_code{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()}};
    }

    const auto endpoints = co_await resolve_endpoints(settings_.host, settings_.port, settings_.timeout);

    beast::get_lowest_layer(stream).expires_after(settings_.timeout);
    co_await beast::get_lowest_layer(stream).async_connect(endpoints, boost::asio::use_awaitable);

    beast::get_lowest_layer(stream).expires_after(settings_.timeout);
    co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);

    http::request<http::empty_body> request{http::verb::get, target, kHttpVersion};
    request.set(http::field::host, settings_.host);
    request.set(http::field::user_agent, kUserAgent);
    request.set(http::field::accept, "application/json");

    beast::get_lowest_layer(stream).expires_after(settings_.timeout);
    co_await http::async_write(stream, request, boost::asio::use_awaitable);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    co_await http::async_read(stream, buffer, response, boost::asio::use_awaitable);

    // The server may close the connection without a proper TLS shutdown
    beast::error_code ec;
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec && ec != boost::asio::ssl::error::stream_truncated) {
        ERANODE_TRACE << "OpenChainResolver::fetch shutdown: " << ec.message() << "\n";
    }

    if (response.result() != http::status::ok) {
        throw std::runtime_error{"unexpected HTTP status: " + std::to_string(response.result_int())};
    }
    co_return response.body();
}

std::optional<std::optional<std::string>> OpenChainResolver::cached(const std::string& key) const {
    std::lock_guard lock{cache_mutex_};
    const auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void OpenChainResolver::store(const std::string& key, const std::optional<std::string>& name) {
    std::lock_guard lock{cache_mutex_};
    cache_.insert_or_assign(key, name);
}

} // namespace eranode::resolver
