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

#include "storage_log_renderer.hpp"

#include <string>

#include <absl/strings/str_cat.h>

#include <eranode/common/constants.hpp>
#include <eranode/common/terminal.hpp>
#include <eranode/common/util.hpp>

namespace eranode {

namespace {
    std::string labeled(const char* label, const std::string& value) {
        return absl::StrCat(terminal::pad_right(label, kStorageLabelWidth), " ", value);
    }
} // namespace

bool should_print(StorageLogType log_type, ShowStorageLogs show_storage_logs) noexcept {
    switch (show_storage_logs) {
        case ShowStorageLogs::None:
            return false;
        case ShowStorageLogs::Read:
            return log_type == StorageLogType::kRead;
        case ShowStorageLogs::Write:
            return log_type != StorageLogType::kRead;
        case ShowStorageLogs::All:
            return true;
    }
    return false;
}

Lines StorageLogRenderer::render(const StorageLogQuery& query) const {
    Lines lines;
    lines.push_back(labeled("Type:", to_string(query.log_type)));
    lines.push_back(labeled("Address:", directory_.display_name(query.address)));
    lines.push_back(labeled("Key:", to_fixed_hex(query.key)));
    lines.push_back(labeled("Read Value:", to_fixed_hex(query.read_value)));
    if (query.is_write()) {
        lines.push_back(labeled("Written Value:", to_fixed_hex(query.written_value)));
    }
    lines.push_back(terminal::repeat("─", kStorageSeparatorWidth));
    return lines;
}

Lines StorageLogRenderer::render(const StorageLogQueries& queries, ShowStorageLogs show_storage_logs) const {
    Lines lines;
    for (const auto& query : queries) {
        if (should_print(query.log_type, show_storage_logs)) {
            auto query_lines = render(query);
            lines.insert(lines.end(), query_lines.begin(), query_lines.end());
        }
    }
    return lines;
}

void print_logs(const StorageLogQuery& query, const AddressDirectory& directory) {
    print_lines(StorageLogRenderer{directory}.render(query));
}

} // namespace eranode
