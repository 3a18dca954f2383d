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

#ifndef ERANODE_FORMATTER_STORAGE_LOG_RENDERER_HPP_
#define ERANODE_FORMATTER_STORAGE_LOG_RENDERER_HPP_

#include <eranode/formatter/address_directory.hpp>
#include <eranode/formatter/lines.hpp>
#include <eranode/types/show_options.hpp>
#include <eranode/types/storage_log.hpp>

namespace eranode {

bool should_print(StorageLogType log_type, ShowStorageLogs show_storage_logs) noexcept;

class StorageLogRenderer {
  public:
    explicit StorageLogRenderer(const AddressDirectory& directory) : directory_(directory) {}

    //! Labeled lines of one storage access terminated by a separator line.
    Lines render(const StorageLogQuery& query) const;

    //! Entries selected by show_storage_logs, in order.
    Lines render(const StorageLogQueries& queries, ShowStorageLogs show_storage_logs) const;

  private:
    const AddressDirectory& directory_;
};

void print_logs(const StorageLogQuery& query, const AddressDirectory& directory);

} // namespace eranode

#endif  // ERANODE_FORMATTER_STORAGE_LOG_RENDERER_HPP_
