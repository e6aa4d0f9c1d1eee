/**
 * @file literal_scanner.cpp
 * @brief Implementation of the composite and array literal scanner
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *         http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <cctype>
#include <cstddef>

#include "./literal_scanner.h"

namespace qb {
namespace pgtext {

namespace {

inline bool
is_whitespace(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

/**
 * @brief Read a double-quoted field
 *
 * `text[start]` must be the opening quote. Appends the unescaped content to
 * `out` and returns the index of the closing quote, or a position past the
 * end of `text` when the quote is never closed.
 */
std::size_t
read_quoted(std::string_view text, std::size_t start, std::string &out) {
    auto const  len = text.size();
    std::size_t idx = start + 1;
    for (; idx < len; ++idx) {
        char ch = text[idx];
        if (ch == '"') {
            if (idx + 1 < len && text[idx + 1] == '"') {
                ++idx;
                out.push_back('"');
                continue;
            }
            break;
        }
        if (ch == '\\') {
            ++idx;
            // a backslash at the very end is kept as is
            if (idx < len)
                ch = text[idx];
        }
        out.push_back(ch);
    }
    return idx;
}

/**
 * @brief Finalize the field that ends at `idx`
 *
 * A delimiter right before `idx` means the field is empty: NULL. Otherwise
 * the buffer, if one was opened, is the field value.
 */
void
add_element(token const &buffer, std::ptrdiff_t last_delimiter, std::size_t idx,
            token_list &values) {
    if (last_delimiter + 1 == static_cast<std::ptrdiff_t>(idx)) {
        values.emplace_back(std::nullopt);
    } else if (buffer) {
        values.emplace_back(*buffer);
    }
}

} // namespace

token_list
scan_literal(std::string_view text, char open, char close) {
    token_list     values;
    token          buffer;
    std::ptrdiff_t last_delimiter = -1;

    auto const len = text.size();
    for (std::size_t idx = 0; idx < len; ++idx) {
        char const ch = text[idx];
        if (ch == open) {
            last_delimiter = static_cast<std::ptrdiff_t>(idx);
        } else if (ch == close) {
            add_element(buffer, last_delimiter, idx, values);
            break;
        } else if (ch == '"') {
            buffer.emplace();
            idx = read_quoted(text, idx, *buffer);
        } else if (ch == ',') {
            add_element(buffer, last_delimiter, idx, values);
            buffer.reset();
            last_delimiter = static_cast<std::ptrdiff_t>(idx);
        } else if (is_whitespace(ch)) {
            // skip the whitespace run, then stop: the rest of the input is dropped
            while (idx < len && is_whitespace(text[idx]))
                ++idx;
            break;
        } else {
            if (!buffer)
                buffer.emplace();
            buffer->push_back(ch);
        }
    }
    return values;
}

} // namespace pgtext
} // namespace qb
