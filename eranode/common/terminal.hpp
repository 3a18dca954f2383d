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

#ifndef ERANODE_COMMON_TERMINAL_HPP_
#define ERANODE_COMMON_TERMINAL_HPP_

#include <cstddef>
#include <string>
#include <string_view>

namespace eranode::terminal {

constexpr const char* kReset{"\x1b[0m"};
constexpr const char* kBold{"\x1b[1m"};
constexpr const char* kDimmed{"\x1b[2m"};
constexpr const char* kGreen{"\x1b[32m"};
constexpr const char* kBlue{"\x1b[34m"};
constexpr const char* kOnRed{"\x1b[41m"};

std::string bold(std::string_view text);
std::string dimmed(std::string_view text);
std::string green(std::string_view text);
std::string blue(std::string_view text);
std::string on_red(std::string_view text);

//! Remove all ANSI escape sequences from text.
std::string strip_styles(std::string_view text);

//! Number of printable characters, i.e. ignoring escape sequences and counting UTF-8 code points once.
std::size_t visible_length(std::string_view text);

//! Pad with spaces on the right up to width visible characters.
std::string pad_right(std::string_view text, std::size_t width);

//! Pad with spaces on the left up to width visible characters.
std::string pad_left(std::string_view text, std::size_t width);

//! Repeat a (possibly multi-byte) glyph count times.
std::string repeat(std::string_view glyph, std::size_t count);

} // namespace eranode::terminal

#endif  // ERANODE_COMMON_TERMINAL_HPP_
