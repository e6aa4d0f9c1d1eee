/**
 * @file record_reader.cpp
 * @brief Text conversions of the record reader
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

#include <cerrno>
#include <cstdlib>
#include <limits>

#include "./record_reader.h"
#include "./type_coercion.h"
#include "./util/text_format.h"

namespace qb {
namespace pgtext {

namespace {

template <typename Int>
bool
read_integral(std::string const &text, Int &value) {
    std::string const trimmed(util::trim(text));
    if (trimmed.empty())
        return false;
    char *end = nullptr;
    errno     = 0;
    long long const v = std::strtoll(trimmed.c_str(), &end, 10);
    if (errno != 0 || end != trimmed.c_str() + trimmed.size())
        return false;
    if (v < std::numeric_limits<Int>::min() || v > std::numeric_limits<Int>::max())
        return false;
    value = static_cast<Int>(v);
    return true;
}

int
hex_digit(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

record_reader::record_reader(std::string_view literal, session_ptr session)
    : record_reader(parse_composite_literal(literal), std::move(session)) {}

record_reader::record_reader(token_list tokens, session_ptr session)
    : _tokens(std::move(tokens))
    , _session(session ? std::move(session) : session_context::default_session()) {}

bool
record_reader::read_text(std::string const &text, smallint &value) const {
    return read_integral(text, value);
}

bool
record_reader::read_text(std::string const &text, integer &value) const {
    return read_integral(text, value);
}

bool
record_reader::read_text(std::string const &text, bigint &value) const {
    return read_integral(text, value);
}

bool
record_reader::read_text(std::string const &text, float &value) const {
    auto d = util::parse_double(text);
    if (!d)
        return false;
    value = static_cast<float>(*d);
    return true;
}

bool
record_reader::read_text(std::string const &text, double &value) const {
    auto d = util::parse_double(text);
    if (!d)
        return false;
    value = *d;
    return true;
}

bool
record_reader::read_text(std::string const &text, bool &value) const {
    try {
        value = cast_to_boolean(pgtext::value(text));
        return true;
    } catch (error::conversion_error const &) {
        return false;
    }
}

bool
record_reader::read_text(std::string const &text, std::string &value) const {
    value = text;
    return true;
}

bool
record_reader::read_text(std::string const &text, decimal &value) const {
    std::string const trimmed(util::trim(text));
    if (!util::is_numeric_literal(trimmed))
        return false;
    try {
        value = decimal(trimmed.c_str());
        return true;
    } catch (std::runtime_error const &) {
        return false;
    }
}

/**
 * Only the hex output format, `\x0123abcd`, is accepted.
 */
bool
record_reader::read_text(std::string const &text, bytea &value) const {
    if (text.size() < 2 || text[0] != '\\' || text[1] != 'x' || text.size() % 2 != 0)
        return false;
    bytea result;
    result.reserve((text.size() - 2) / 2);
    for (std::size_t i = 2; i < text.size(); i += 2) {
        int const high = hex_digit(text[i]);
        int const low  = hex_digit(text[i + 1]);
        if (high < 0 || low < 0)
            return false;
        result.push_back(static_cast<byte>((high << 4) | low));
    }
    value.swap(result);
    return true;
}

bool
record_reader::read_text(std::string const &text, date &value) const {
    try {
        value = _session->parser().to_date(_session->default_calendar(), text);
        return true;
    } catch (error::conversion_error const &) {
        return false;
    }
}

bool
record_reader::read_text(std::string const &text, time_of_day &value) const {
    try {
        value = _session->parser().to_time(_session->default_calendar(), text);
        return true;
    } catch (error::conversion_error const &) {
        return false;
    }
}

bool
record_reader::read_text(std::string const &text, timestamp &value) const {
    try {
        value = _session->parser().to_timestamp(_session->default_calendar(), text);
        return true;
    } catch (error::conversion_error const &) {
        return false;
    }
}

bool
record_reader::read_text(std::string const &text, point &value) const {
    auto p = parse_point(text);
    if (!p)
        return false;
    value = *p;
    return true;
}

bool
record_reader::read_text(std::string const &text, box &value) const {
    auto b = parse_box(text);
    if (!b)
        return false;
    value = *b;
    return true;
}

} // namespace pgtext
} // namespace qb
