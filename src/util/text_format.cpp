/**
 * @file text_format.cpp
 * @brief Implementation of the text formatting helpers
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
#include <charconv>
#include <cmath>
#include <regex>
#include <system_error>

#include "./text_format.h"

namespace qb {
namespace pgtext {
namespace util {

namespace {

template <typename T>
std::string
format_shortest(T value, int max_precision) {
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value > 0 ? "Infinity" : "-Infinity";

    char        buffer[64];
    std::size_t length = 0;
    for (int precision = 1; precision <= max_precision; ++precision) {
        auto const res = std::to_chars(buffer, buffer + sizeof(buffer), value,
                                       std::chars_format::general, precision);
        length         = static_cast<std::size_t>(res.ptr - buffer);
        T read_back{};
        std::from_chars(buffer, res.ptr, read_back);
        if (read_back == value)
            break;
    }
    return std::string(buffer, length);
}

} // namespace

std::string
format_double(double value) {
    return format_shortest(value, 17);
}

std::string
format_float(float value) {
    return format_shortest(value, 9);
}

std::optional<double>
parse_double(std::string_view text) {
    auto trimmed = trim(text);
    // from_chars takes no leading '+'
    if (trimmed.size() > 1 && trimmed.front() == '+' && trimmed[1] != '-' && trimmed[1] != '+')
        trimmed.remove_prefix(1);
    if (trimmed.empty())
        return std::nullopt;

    double      result = 0;
    char const *last   = trimmed.data() + trimmed.size();
    auto const  res    = std::from_chars(trimmed.data(), last, result);
    if (res.ec != std::errc() || res.ptr != last)
        return std::nullopt;
    return result;
}

bool
is_numeric_literal(std::string_view text) {
    static const std::regex numeric_regex(R"([+-]?(\d+(\.\d*)?|\.\d+)([eE][+-]?\d+)?)");
    return std::regex_match(text.begin(), text.end(), numeric_regex);
}

std::string_view
trim(std::string_view text) {
    std::size_t first = 0;
    std::size_t last  = text.size();
    while (first < last && std::isspace(static_cast<unsigned char>(text[first])))
        ++first;
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1])))
        --last;
    return text.substr(first, last - first);
}

bool
iequals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size())
        return false;
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i])))
            return false;
    }
    return true;
}

} // namespace util
} // namespace pgtext
} // namespace qb
