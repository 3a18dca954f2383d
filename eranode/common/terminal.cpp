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

#include "terminal.hpp"

#include <string>

#include <absl/strings/str_cat.h>

namespace eranode::terminal {

namespace {
    std::string styled(const char* style, std::string_view text) {
        return absl::StrCat(style, text, kReset);
    }

    // CSI sequences are ESC '[' parameters final-byte, final byte in range 0x40-0x7e
    std::size_t escape_length(std::string_view text, std::size_t pos) {
        if (pos + 1 >= text.size() || text[pos] != '\x1b' || text[pos + 1] != '[') {
            return 0;
        }
        std::size_t end = pos + 2;
        while (end < text.size() && !(text[end] >= 0x40 && text[end] <= 0x7e)) {
            ++end;
        }
        return end < text.size() ? end - pos + 1 : text.size() - pos;
    }
} // namespace

std::string bold(std::string_view text) {
    return styled(kBold, text);
}

std::string dimmed(std::string_view text) {
    return styled(kDimmed, text);
}

std::string green(std::string_view text) {
    return styled(kGreen, text);
}

std::string blue(std::string_view text) {
    return styled(kBlue, text);
}

std::string on_red(std::string_view text) {
    return styled(kOnRed, text);
}

std::string strip_styles(std::string_view text) {
    std::string plain;
    plain.reserve(text.size());
    std::size_t pos{0};
    while (pos < text.size()) {
        const auto skip = escape_length(text, pos);
        if (skip > 0) {
            pos += skip;
        } else {
            plain.push_back(text[pos++]);
        }
    }
    return plain;
}

std::size_t visible_length(std::string_view text) {
    std::size_t length{0};
    for (const auto c : strip_styles(text)) {
        // UTF-8 continuation bytes do not start a new code point
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++length;
        }
    }
    return length;
}

std::string pad_right(std::string_view text, std::size_t width) {
    const auto length = visible_length(text);
    std::string padded{text};
    if (length < width) {
        padded.append(width - length, ' ');
    }
    return padded;
}

std::string pad_left(std::string_view text, std::size_t width) {
    const auto length = visible_length(text);
    if (length >= width) {
        return std::string{text};
    }
    return std::string(width - length, ' ') + std::string{text};
}

std::string repeat(std::string_view glyph, std::size_t count) {
    std::string repeated;
    repeated.reserve(glyph.size() * count);
    for (std::size_t i{0}; i < count; ++i) {
        repeated.append(glyph);
    }
    return repeated;
}

} // namespace eranode::terminal
