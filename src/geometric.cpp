/**
 * @file geometric.cpp
 * @brief Implementation of geometric value parsing and printing
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

#include <iostream>
#include <vector>

#include "./geometric.h"
#include "./util/text_format.h"

namespace qb {
namespace pgtext {

namespace {

/**
 * @brief Split on `delimiter` outside of (), [] and <> groups
 */
std::vector<std::string_view>
split_top_level(std::string_view text, char delimiter) {
    std::vector<std::string_view> tokens;
    int                           depth = 0;
    std::size_t                   start = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char const c = text[i];
        if (c == '(' || c == '[' || c == '<') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '>') {
            --depth;
        } else if (c == delimiter && depth == 0) {
            tokens.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    tokens.push_back(text.substr(start));
    return tokens;
}

/**
 * @brief Strip one pair of enclosing parentheses, if present
 */
std::string_view
remove_parentheses(std::string_view text) {
    text = util::trim(text);
    if (text.size() >= 2 && text.front() == '(' && text.back() == ')')
        return text.substr(1, text.size() - 2);
    return text;
}

} // namespace

std::optional<point>
parse_point(std::string_view text) {
    auto const tokens = split_top_level(remove_parentheses(text), ',');
    if (tokens.size() != 2)
        return std::nullopt;

    auto const x = util::parse_double(tokens[0]);
    auto const y = util::parse_double(tokens[1]);
    if (!x || !y)
        return std::nullopt;
    return point{*x, *y};
}

std::optional<box>
parse_box(std::string_view text) {
    auto const tokens = split_top_level(util::trim(text), ',');
    if (tokens.size() != 2)
        return std::nullopt;

    auto const first  = parse_point(tokens[0]);
    auto const second = parse_point(tokens[1]);
    if (!first || !second)
        return std::nullopt;
    return box{*first, *second};
}

std::string
to_string(point const &p) {
    return "(" + util::format_double(p.x) + "," + util::format_double(p.y) + ")";
}

std::string
to_string(box const &b) {
    return to_string(b.first) + "," + to_string(b.second);
}

std::ostream &
operator<<(std::ostream &os, point const &p) {
    return os << to_string(p);
}

std::ostream &
operator<<(std::ostream &os, box const &b) {
    return os << to_string(b);
}

} // namespace pgtext
} // namespace qb
