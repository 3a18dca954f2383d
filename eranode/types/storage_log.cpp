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

#include "storage_log.hpp"

namespace eranode {

std::string to_string(StorageLogType log_type) {
    switch (log_type) {
        case StorageLogType::kRead: return "Read";
        case StorageLogType::kInitialWrite: return "InitialWrite";
        case StorageLogType::kRepeatedWrite: return "RepeatedWrite";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& out, StorageLogType log_type) {
    out << to_string(log_type);
    return out;
}

} // namespace eranode
