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

#include "lines.hpp"

#include <iostream>
#include <sstream>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch.hpp>
#include <evmc/evmc.hpp>
#include <gmock/gmock.h>

#include <eranode/common/log.hpp>
#include <eranode/formatter/call_trace_renderer.hpp>
#include <eranode/formatter/event_renderer.hpp>
#include <eranode/formatter/execution_summary_renderer.hpp>
#include <eranode/formatter/storage_log_renderer.hpp>
#include <eranode/test/mock_selector_resolver.hpp>

namespace eranode {

using evmc::literals::operator""_address;

// Capture Info records written while alive
class LogCapture {
  public:
    LogCapture() {
        ERANODE_LOG_STREAMS(out_, err_);
        ERANODE_LOG_VERBOSITY(LogLevel::Info);
    }
    ~LogCapture() {
        ERANODE_LOG_STREAMS(std::cout, std::cerr);
        ERANODE_LOG_VERBOSITY(LogLevel::Critical);
    }

    std::string output() const { return out_.str(); }

  private:
    std::ostringstream out_;
    std::ostringstream err_;
};

static std::size_t count_records(const std::string& output) {
    std::size_t count{0};
    for (auto pos = output.find("[ INFO]"); pos != std::string::npos; pos = output.find("[ INFO]", pos + 1)) {
        ++count;
    }
    return count;
}

TEST_CASE("print_lines", "[eranode][formatter][lines]") {
    LogCapture capture;
    print_lines(Lines{"first", "second"});
    const auto output = capture.output();
    CHECK(count_records(output) == 2);
    CHECK(output.find("first") < output.find("second"));
}

TEST_CASE("print one record per rendered line", "[eranode][formatter][lines]") {
    const auto directory = AddressDirectory::load(R"([
        {"address": "0x000000000000000000000000000000000000800a", "name": "L2EthToken", "contract_type": "System"}
    ])");
    testing::StrictMock<test::MockSelectorResolver> resolver;

    SECTION("print_vm_details") {
        LogCapture capture;
        print_vm_details(ExecutionSummary{});
        CHECK(count_records(capture.output()) == render_execution_summary(ExecutionSummary{}).size());
        CHECK(capture.output().find("VM EXECUTION RESULTS") != std::string::npos);
    }

    SECTION("print_logs") {
        StorageLogQuery query;
        query.address = 0x000000000000000000000000000000000000800a_address;
        LogCapture capture;
        print_logs(query, directory);
        CHECK(count_records(capture.output()) == 5);
        CHECK(capture.output().find("L2EthToken") != std::string::npos);
    }

    SECTION("print_call") {
        Call child;
        child.to = 0x000000000000000000000000000000000000800a_address;
        Call call;
        call.to = 0x000000000000000000000000000000000000800a_address;
        call.calls.push_back(child);
        LogCapture capture;
        boost::asio::thread_pool pool{1};
        auto result = boost::asio::co_spawn(pool, print_call(call, directory, resolver, ShowCalls::All, false), boost::asio::use_future);
        result.get();
        CHECK(count_records(capture.output()) == 2);
    }

    SECTION("print_event") {
        VmEvent event;
        event.address = 0x000000000000000000000000000000000000800a_address;
        LogCapture capture;
        boost::asio::thread_pool pool{1};
        auto result = boost::asio::co_spawn(pool, print_event(event, directory, resolver, false), boost::asio::use_future);
        result.get();
        CHECK(count_records(capture.output()) == 1);
        CHECK(capture.output().find("L2EthToken") != std::string::npos);
    }
}

} // namespace eranode
