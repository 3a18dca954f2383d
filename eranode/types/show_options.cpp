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

#include "show_options.hpp"

#include <string>

namespace eranode {

std::ostream& operator<<(std::ostream& out, ShowCalls show_calls) {
    out << AbslUnparseFlag(show_calls);
    return out;
}

std::ostream& operator<<(std::ostream& out, ShowStorageLogs show_storage_logs) {
    out << AbslUnparseFlag(show_storage_logs);
    return out;
}

std::ostream& operator<<(std::ostream& out, ShowVmDetails show_vm_details) {
    out << AbslUnparseFlag(show_vm_details);
    return out;
}

bool AbslParseFlag(absl::string_view text, ShowCalls* show_calls, std::string* error) {
    if (text == "none") {
        *show_calls = ShowCalls::None;
        return true;
    }
    if (text == "user") {
        *show_calls = ShowCalls::User;
        return true;
    }
    if (text == "system") {
        *show_calls = ShowCalls::System;
        return true;
    }
    if (text == "all") {
        *show_calls = ShowCalls::All;
        return true;
    }
    *error = "unknown value for ShowCalls, expected one of: none, user, system, all";
    return false;
}

std::string AbslUnparseFlag(ShowCalls show_calls) {
    switch (show_calls) {
        case ShowCalls::None: return "none";
        case ShowCalls::User: return "user";
        case ShowCalls::System: return "system";
        case ShowCalls::All: return "all";
    }
    return "none";
}

bool AbslParseFlag(absl::string_view text, ShowStorageLogs* show_storage_logs, std::string* error) {
    if (text == "none") {
        *show_storage_logs = ShowStorageLogs::None;
        return true;
    }
    if (text == "read") {
        *show_storage_logs = ShowStorageLogs::Read;
        return true;
    }
    if (text == "write") {
        *show_storage_logs = ShowStorageLogs::Write;
        return true;
    }
    if (text == "all") {
        *show_storage_logs = ShowStorageLogs::All;
        return true;
    }
    *error = "unknown value for ShowStorageLogs, expected one of: none, read, write, all";
    return false;
}

std::string AbslUnparseFlag(ShowStorageLogs show_storage_logs) {
    switch (show_storage_logs) {
        case ShowStorageLogs::None: return "none";
        case ShowStorageLogs::Read: return "read";
        case ShowStorageLogs::Write: return "write";
        case ShowStorageLogs::All: return "all";
    }
    return "none";
}

bool AbslParseFlag(absl::string_view text, ShowVmDetails* show_vm_details, std::string* error) {
    if (text == "none") {
        *show_vm_details = ShowVmDetails::None;
        return true;
    }
    if (text == "all") {
        *show_vm_details = ShowVmDetails::All;
        return true;
    }
    *error = "unknown value for ShowVmDetails, expected one of: none, all";
    return false;
}

std::string AbslUnparseFlag(ShowVmDetails show_vm_details) {
    switch (show_vm_details) {
        case ShowVmDetails::None: return "none";
        case ShowVmDetails::All: return "all";
    }
    return "none";
}

} // namespace eranode
