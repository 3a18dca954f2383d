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

#ifndef ERANODE_COMMON_LOG_HPP_
#define ERANODE_COMMON_LOG_HPP_

#include <absl/strings/string_view.h>

#include <mutex>
#include <ostream>
#include <string>

namespace eranode {

// available verbosity levels
enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, None };

// silence
std::ostream& null_stream();

//
// Below are for access via macros ONLY.
//
extern LogLevel log_verbosity_;
extern bool log_thread_enabled_;
void log_set_streams_(std::ostream& o1, std::ostream& o2);
class log_ {
  public:
    explicit log_(LogLevel level) : level_(level) { log_mtx_.lock(); }
    ~log_() { log_mtx_.unlock(); }
    std::ostream& header_(LogLevel);
    template <class T>
    std::ostream& operator<<(const T& message) {
        return header_(level_) << message;
    }

  private:
    friend void log_set_streams_(std::ostream& o1, std::ostream& o2);

    LogLevel level_;
    static std::mutex log_mtx_;
};

using Logger = log_;

#define ERANODE_LOG_AT(level_) if ((level_) < eranode::log_verbosity_) {} else eranode::log_(level_) << " " // NOLINT

// LogTrace, LogDebug, LogInfo, LogWarn, LogError, LogCritical, LogNone
#define ERANODE_TRACE ERANODE_LOG_AT(eranode::LogLevel::Trace)
#define ERANODE_DEBUG ERANODE_LOG_AT(eranode::LogLevel::Debug)
#define ERANODE_INFO  ERANODE_LOG_AT(eranode::LogLevel::Info)
#define ERANODE_WARN  ERANODE_LOG_AT(eranode::LogLevel::Warn)
#define ERANODE_ERROR ERANODE_LOG_AT(eranode::LogLevel::Error)
#define ERANODE_CRIT  ERANODE_LOG_AT(eranode::LogLevel::Critical)
#define ERANODE_LOG   ERANODE_LOG_AT(eranode::LogLevel::None)

#define ERANODE_LOG_VERBOSITY(level_) (eranode::log_verbosity_ = (level_))

#define ERANODE_LOG_THREAD(log_thread_) (eranode::log_thread_enabled_ = (log_thread_))

#define ERANODE_LOG_STREAMS(stream1_, stream2_) eranode::log_set_streams_((stream1_), (stream2_))

bool AbslParseFlag(absl::string_view text, LogLevel* level, std::string* error);
std::string AbslUnparseFlag(LogLevel level);

} // namespace eranode

#endif  // ERANODE_COMMON_LOG_HPP_
