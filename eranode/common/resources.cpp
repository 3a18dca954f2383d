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

#include "resources.hpp"

#include <eranode/common/log.hpp>

namespace eranode::resources {

std::optional<silkworm::ByteView> find(std::string_view name) {
    for (std::size_t i{0}; i < kEmbeddedResourceCount; ++i) {
        const auto& resource = kEmbeddedResources[i];
        if (name == resource.name) {
            ERANODE_TRACE << "resources::find name: " << name << " size: " << resource.size << "\n";
            return silkworm::ByteView{resource.data, resource.size};
        }
    }
    ERANODE_DEBUG << "resources::find name: " << name << " not embedded\n";
    return std::nullopt;
}

std::optional<std::string_view> find_text(std::string_view name) {
    const auto content = find(name);
    if (!content) {
        return std::nullopt;
    }
    return std::string_view{reinterpret_cast<const char*>(content->data()), content->size()};
}

} // namespace eranode::resources
