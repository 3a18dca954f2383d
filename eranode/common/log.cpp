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

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

#include <absl/strings/str_cat.h>

namespace eranode {

LogLevel log_verbosity_{LogLevel::Info};
bool log_thread_enabled_{false};
std::mutex log_::log_mtx_;

namespace {
    std::ostream* out_stream_{&std::cout};
    std::ostream* err_stream_{&std::cerr};

    const char* level_tag(LogLevel level) {
        switch (level) {
            case LogLevel::Trace: return "TRACE";
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return " INFO";
            case LogLevel::Warn: return " WARN";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Critical: return " CRIT";
            default: return "  LOG";
        }
    }

    class NullBuffer : public std::streambuf {
      public:
        int overflow(int c) override { return c; }
    };
} // namespace

std::ostream& null_stream() {
    static NullBuffer null_buffer;
    static std::ostream null_ostream{&null_buffer};
    return null_ostream;
}

void log_set_streams_(std::ostream& o1, std::ostream& o2) {
    std::lock_guard<std::mutex> lock{log_::log_mtx_};
    out_stream_ = &o1;
    err_stream_ = &o2;
}

std::ostream& log_::header_(LogLevel level) {
    std::ostream& out = (level == LogLevel::Error || level == LogLevel::Critical) ? *err_stream_ : *out_stream_;

    const auto now = std::chrono::system_clock::now();
    const auto now_time = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local_time{};
    localtime_r(&now_time, &local_time);

    out << "[" << level_tag(level) << "] " << std::put_time(&local_time, "%m-%d|%H:%M:%S") << "."
        << std::setw(3) << std::setfill('0') << millis << std::setfill(' ');
    if (log_thread_enabled_) {
        out << " [" << std::this_thread::get_id() << "]";
    }
    return out;
}

bool AbslParseFlag(absl::string_view text, LogLevel* level, std::string* error) {
    if (text == "n") {
        *level = LogLevel::None;
        return true;
    }
    if (text == "c") {
        *level = LogLevel::Critical;
        return true;
    }
    if (text == "e") {
        *level = LogLevel::Error;
        return true;
    }
    if (text == "w") {
        *level = LogLevel::Warn;
        return true;
    }
    if (text == "i") {
        *level = LogLevel::Info;
        return true;
    }
    if (text == "d") {
        *level = LogLevel::Debug;
        return true;
    }
    if (text == "t") {
        *level = LogLevel::Trace;
        return true;
    }
    *error = "unknown value for LogLevel";
    return false;
}

std::string AbslUnparseFlag(LogLevel level) {
    switch (level) {
        case LogLevel::None: return "n";
        case LogLevel::Critical: return "c";
        case LogLevel::Error: return "e";
        case LogLevel::Warn: return "w";
        case LogLevel::Info: return "i";
        case LogLevel::Debug: return "d";
        case LogLevel::Trace: return "t";
        default: return absl::StrCat(static_cast<int>(level));
    }
}

} // namespace eranode
