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

#include "log.hpp"

#include <iostream>
#include <sstream>
#include <string>

#include <catch2/catch.hpp>

namespace eranode {

TEST_CASE("parse log level flag", "[eranode][common][log]") {
    LogLevel level{LogLevel::None};
    std::string error;

    CHECK(AbslParseFlag("t", &level, &error));
    CHECK(level == LogLevel::Trace);
    CHECK(AbslParseFlag("i", &level, &error));
    CHECK(level == LogLevel::Info);
    CHECK(AbslParseFlag("c", &level, &error));
    CHECK(level == LogLevel::Critical);
    CHECK(!AbslParseFlag("x", &level, &error));
    CHECK(error == "unknown value for LogLevel");
}

TEST_CASE("unparse log level flag", "[eranode][common][log]") {
    CHECK(AbslUnparseFlag(LogLevel::Trace) == "t");
    CHECK(AbslUnparseFlag(LogLevel::Warn) == "w");
    CHECK(AbslUnparseFlag(LogLevel::None) == "n");
}

TEST_CASE("log verbosity filters messages", "[eranode][common][log]") {
    std::ostringstream out;
    std::ostringstream err;
    ERANODE_LOG_STREAMS(out, err);

    SECTION("message below verbosity is dropped") {
        ERANODE_LOG_VERBOSITY(LogLevel::Warn);
        ERANODE_INFO << "hidden\n";
        CHECK(out.str().empty());
    }

    SECTION("message at verbosity is written with level tag") {
        ERANODE_LOG_VERBOSITY(LogLevel::Info);
        ERANODE_INFO << "visible\n";
        CHECK(out.str().find("[ INFO]") != std::string::npos);
        CHECK(out.str().find("visible") != std::string::npos);
        CHECK(err.str().empty());
    }

    SECTION("errors go to the second stream") {
        ERANODE_LOG_VERBOSITY(LogLevel::Info);
        ERANODE_ERROR << "failure\n";
        CHECK(out.str().empty());
        CHECK(err.str().find("failure") != std::string::npos);
    }

    ERANODE_LOG_STREAMS(std::cout, std::cerr);
    ERANODE_LOG_VERBOSITY(LogLevel::Critical);
}

TEST_CASE("null stream swallows output", "[eranode][common][log]") {
    CHECK_NOTHROW(null_stream() << "anything" << 42);
}

} // namespace eranode
