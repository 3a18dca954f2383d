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

#ifndef ERANODE_TYPES_STORAGE_LOG_HPP_
#define ERANODE_TYPES_STORAGE_LOG_HPP_

#include <iostream>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

namespace eranode {

enum class StorageLogType {
    kRead,
    kInitialWrite,
    kRepeatedWrite
};

std::string to_string(StorageLogType log_type);
std::ostream& operator<<(std::ostream& out, StorageLogType log_type);

struct StorageLogQuery {
    StorageLogType log_type{StorageLogType::kRead};
    evmc::address address;
    intx::uint256 key;
    intx::uint256 read_value;
    intx::uint256 written_value; // meaningful only for write queries

    bool is_write() const noexcept { return log_type != StorageLogType::kRead; }
};

typedef std::vector<StorageLogQuery> StorageLogQueries;

} // namespace eranode

#endif  // ERANODE_TYPES_STORAGE_LOG_HPP_
