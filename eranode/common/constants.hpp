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

#ifndef ERANODE_COMMON_CONSTANTS_HPP_
#define ERANODE_COMMON_CONSTANTS_HPP_

#include <chrono>
#include <cstddef>

namespace eranode {

constexpr const char* kDefaultOpenChainHost{"api.openchain.xyz"};
constexpr const char* kDefaultOpenChainPort{"443"};
constexpr const char* kOpenChainLookupTarget{"/signature-database/v1/lookup"};
constexpr const std::chrono::milliseconds kDefaultTimeout{5000};

constexpr const char* kZkSyncHomeEnv{"ZKSYNC_HOME"};
constexpr const char* kEmptyTraceFile{""};

constexpr const std::size_t kCallPaddingIncrement{2};
constexpr const std::size_t kCallLabelWidth{52};
constexpr const std::size_t kFunctionSignatureWidth{16};
constexpr const std::size_t kEventLabelWidth{42};
constexpr const std::size_t kStorageLabelWidth{15};
constexpr const std::size_t kStorageSeparatorWidth{82};

constexpr const char* kTopicSeparator{", "};

} // namespace eranode

#endif  // ERANODE_COMMON_CONSTANTS_HPP_
