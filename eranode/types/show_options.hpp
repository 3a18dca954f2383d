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

#ifndef ERANODE_TYPES_SHOW_OPTIONS_HPP_
#define ERANODE_TYPES_SHOW_OPTIONS_HPP_

#include <iostream>
#include <string>

#include <absl/strings/string_view.h>

namespace eranode {

// which calls of the trace are displayed
enum class ShowCalls { None, User, System, All };

// which storage log entries are displayed
enum class ShowStorageLogs { None, Read, Write, All };

// whether the VM execution summary is displayed
enum class ShowVmDetails { None, All };

std::ostream& operator<<(std::ostream& out, ShowCalls show_calls);
std::ostream& operator<<(std::ostream& out, ShowStorageLogs show_storage_logs);
std::ostream& operator<<(std::ostream& out, ShowVmDetails show_vm_details);

bool AbslParseFlag(absl::string_view text, ShowCalls* show_calls, std::string* error);
std::string AbslUnparseFlag(ShowCalls show_calls);

bool AbslParseFlag(absl::string_view text, ShowStorageLogs* show_storage_logs, std::string* error);
std::string AbslUnparseFlag(ShowStorageLogs show_storage_logs);

bool AbslParseFlag(absl::string_view text, ShowVmDetails* show_vm_details, std::string* error);
std::string AbslUnparseFlag(ShowVmDetails show_vm_details);

} // namespace eranode

#endif  // ERANODE_TYPES_SHOW_OPTIONS_HPP_
