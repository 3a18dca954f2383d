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

#include <chrono>
#include <stdexcept>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/system/system_error.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch.hpp>
#include <evmc/evmc.hpp>
#include <gmock/gmock.h>

namespace eranode::resolver {

using evmc::literals::operator""_bytes32;
using testing::InvokeWithoutArgs;

class MockTransportOpenChainResolver : public OpenChainResolver {
  public:
    MOCK_METHOD((boost::asio::awaitable<std::string>), fetch, (const std::string&), (override));
};

static auto reply_with(std::string body) {
    return InvokeWithoutArgs([body]() -> boost::asio::awaitable<std::string> { co_return body; });
}

TEST_CASE("normalize_selector", "[eranode][resolver][openchain_resolver]") {
    CHECK(normalize_selector("a9059cbb") == "0xa9059cbb");
    CHECK(normalize_selector("0xA9059CBB") == "0xa9059cbb");
    CHECK(normalize_selector("0X12") == "0x12");
    CHECK(normalize_selector("") == "0x");
}

TEST_CASE("make_lookup_target", "[eranode][resolver][openchain_resolver]") {
    CHECK(make_lookup_target(SelectorKind::kFunction, "a9059cbb") == "/signature-database/v1/lookup?function=0xa9059cbb&filter=true");
    CHECK(make_lookup_target(SelectorKind::kEvent, "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef") ==
        "/signature-database/v1/lookup?event=0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef&filter=true");
}

TEST_CASE("parse_lookup_response", "[eranode][resolver][openchain_resolver]") {
    SECTION("function found") {
        const auto body = R"({"ok":true,"result":{"event":{},"function":{"0xa9059cbb":[
            {"name":"transfer(address,uint256)","filtered":false},
            {"name":"many_msg_babbage(bytes1)","filtered":false}
        ]}}})";
        CHECK(parse_lookup_response(body, SelectorKind::kFunction, "a9059cbb") == "transfer(address,uint256)");
    }

    SECTION("event found") {
        const auto body = R"({"ok":true,"result":{"function":{},"event":{
            "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef":[
                {"name":"Transfer(address,address,uint256)","filtered":false}
        ]}}})";
        const auto name = parse_lookup_response(body, SelectorKind::kEvent,
            "0xDDF252AD1BE2C89B69C2B068FC378DAA952BA7F163C4A11628F55A4DF523B3EF");
        CHECK(name == "Transfer(address,address,uint256)");
    }

    SECTION("unknown selector") {
        CHECK(!parse_lookup_response(R"({"ok":true,"result":{"function":{"0x12345678":null}}})", SelectorKind::kFunction, "12345678"));
        CHECK(!parse_lookup_response(R"({"ok":true,"result":{"function":{"0x12345678":[]}}})", SelectorKind::kFunction, "12345678"));
        CHECK(!parse_lookup_response(R"({"ok":true,"result":{"function":{}}})", SelectorKind::kFunction, "12345678"));
    }

    SECTION("wrong kind") {
        const auto body = R"({"ok":true,"result":{"function":{"0x12345678":[{"name":"foo()"}]}}})";
        CHECK(!parse_lookup_response(body, SelectorKind::kEvent, "12345678"));
    }

    SECTION("failed reply") {
        CHECK(!parse_lookup_response(R"({"ok":false,"error":"invalid selector"})", SelectorKind::kFunction, "12345678"));
        CHECK(!parse_lookup_response(R"({"result":{}})", SelectorKind::kFunction, "12345678"));
    }

    SECTION("malformed reply") {
        CHECK(!parse_lookup_response("", SelectorKind::kFunction, "12345678"));
        CHECK(!parse_lookup_response("<html></html>", SelectorKind::kFunction, "12345678"));
        CHECK(!parse_lookup_response("[]", SelectorKind::kFunction, "12345678"));
        CHECK(!parse_lookup_response(R"({"ok":true,"result":{"function":{"0x12345678":[{"id":1}]}}})", SelectorKind::kFunction, "12345678"));
    }
}

TEST_CASE("resolve_endpoints", "[eranode][resolver][openchain_resolver]") {
    boost::asio::thread_pool pool{1};

    SECTION("numeric host within deadline") {
        auto result = boost::asio::co_spawn(pool, resolve_endpoints("127.0.0.1", "443", std::chrono::milliseconds{5000}),
            boost::asio::use_future);
        const auto endpoints = result.get();
        REQUIRE(!endpoints.empty());
        CHECK(endpoints.begin()->endpoint().port() == 443);
    }

    SECTION("unresolvable host fails instead of waiting") {
        auto result = boost::asio::co_spawn(pool, resolve_endpoints("eranode.invalid", "443", std::chrono::milliseconds{1}),
            boost::asio::use_future);
        CHECK_THROWS_AS(result.get(), boost::system::system_error);
    }
}

TEST_CASE("OpenChainResolver unreachable service", "[eranode][resolver][openchain_resolver]") {
    boost::asio::thread_pool pool{1};
    OpenChainResolver resolver{OpenChainSettings{"127.0.0.1", "1", std::chrono::milliseconds{500}}};

    SECTION("function selector") {
        auto result = boost::asio::co_spawn(pool, resolver.resolve_function_selector("a9059cbb"), boost::asio::use_future);
        CHECK(!result.get());
    }

    SECTION("event selector") {
        const auto topic = 0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32;
        auto result = boost::asio::co_spawn(pool, resolver.resolve_event_selector(topic), boost::asio::use_future);
        CHECK(!result.get());
    }

    // Transport failures are not remembered so that a later lookup can succeed
    CHECK(resolver.cache_size() == 0);
}

TEST_CASE("OpenChainResolver cache", "[eranode][resolver][openchain_resolver]") {
    boost::asio::thread_pool pool{1};
    MockTransportOpenChainResolver resolver;

    const auto resolve_function = [&](const std::string& selector) {
        return boost::asio::co_spawn(pool, resolver.resolve_function_selector(selector), boost::asio::use_future).get();
    };

    SECTION("found name is fetched once") {
        EXPECT_CALL(resolver, fetch("/signature-database/v1/lookup?function=0xa9059cbb&filter=true")).WillOnce(reply_with(
            R"({"ok":true,"result":{"event":{},"function":{"0xa9059cbb":[{"name":"transfer(address,uint256)","filtered":false}]}}})"));
        CHECK(resolve_function("a9059cbb") == "transfer(address,uint256)");
        CHECK(resolve_function("0xA9059CBB") == "transfer(address,uint256)");
        CHECK(resolver.cache_size() == 1);
    }

    SECTION("not found reply is fetched once") {
        EXPECT_CALL(resolver, fetch("/signature-database/v1/lookup?function=0x12345678&filter=true")).WillOnce(reply_with(
            R"({"ok":true,"result":{"event":{},"function":{"0x12345678":null}}})"));
        CHECK(!resolve_function("12345678"));
        CHECK(!resolve_function("12345678"));
        CHECK(resolver.cache_size() == 1);
    }

    SECTION("function and event selectors are cached separately") {
        const auto topic = 0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32;
        EXPECT_CALL(resolver, fetch("/signature-database/v1/lookup?function=0xa9059cbb&filter=true")).WillOnce(reply_with(
            R"({"ok":true,"result":{"event":{},"function":{"0xa9059cbb":[{"name":"transfer(address,uint256)"}]}}})"));
        EXPECT_CALL(resolver, fetch("/signature-database/v1/lookup?event="
                                    "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef&filter=true")).WillOnce(reply_with(
            R"({"ok":true,"result":{"function":{},"event":{"0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef":[{"name":"Transfer(address,address,uint256)"}]}}})"));
        CHECK(resolve_function("a9059cbb") == "transfer(address,uint256)");
        for (int i{0}; i < 2; ++i) {
            auto result = boost::asio::co_spawn(pool, resolver.resolve_event_selector(topic), boost::asio::use_future);
            CHECK(result.get() == "Transfer(address,address,uint256)");
        }
        CHECK(resolver.cache_size() == 2);
    }

    SECTION("transport failure is retried") {
        EXPECT_CALL(resolver, fetch("/signature-database/v1/lookup?function=0x12345678&filter=true")).Times(2).WillRepeatedly(
            InvokeWithoutArgs([]() -> boost::asio::awaitable<std::string> {
                throw std::runtime_error{"unexpected HTTP status: 503"};
                co_return "";
            }));
        CHECK(!resolve_function("12345678"));
        CHECK(!resolve_function("12345678"));
        CHECK(resolver.cache_size() == 0);
    }
}

TEST_CASE("SelectorKind to_string", "[eranode][resolver][openchain_resolver]") {
    CHECK(to_string(SelectorKind::kFunction) == "function");
    CHECK(to_string(SelectorKind::kEvent) == "event");
}

} // namespace eranode::resolver
