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

#ifndef ERANODE_COMMON_RESOURCES_HPP_
#define ERANODE_COMMON_RESOURCES_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include <silkworm/common/base.hpp>

namespace eranode::resources {

struct Resource {
    const char* name;
    const uint8_t* data;
    std::size_t size;
};

// Defined in the source generated by cmake/embed_resources.cmake from the resources directory
extern const Resource kEmbeddedResources[];
extern const std::size_t kEmbeddedResourceCount;

//! Content of the file embedded at build time, looked up by its path relative to the resources directory.
std::optional<silkworm::ByteView> find(std::string_view name);

//! Same as find, but as text.
std::optional<std::string_view> find_text(std::string_view name);

} // namespace eranode::resources

#endif  // ERANODE_COMMON_RESOURCES_HPP_
