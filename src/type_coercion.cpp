/**
 * @file type_coercion.cpp
 * @brief Implementation of the value coercion rules
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

#include <array>

#include <qb/io.h>

#include "./error.h"
#include "./type_coercion.h"
#include "./util/text_format.h"

namespace qb {
namespace pgtext {

namespace {

const std::array<char const *, 6> TRUE_VALUES{"1", "true", "t", "yes", "y", "on"};
const std::array<char const *, 6> FALSE_VALUES{"0", "false", "f", "no", "n", "off"};

bool
from_string(std::string const &text) {
    auto const trimmed = util::trim(text);
    for (auto candidate : TRUE_VALUES) {
        if (util::iequals(trimmed, candidate))
            return true;
    }
    for (auto candidate : FALSE_VALUES) {
        if (util::iequals(trimmed, candidate))
            return false;
    }
    throw error::conversion_error("Cannot cast to boolean: \"" + text + "\"");
}

bool
from_char(char c) {
    switch (c) {
    case '1':
    case 't':
    case 'T':
    case 'y':
    case 'Y':
        return true;
    case '0':
    case 'f':
    case 'F':
    case 'n':
    case 'N':
        return false;
    default:
        break;
    }
    throw error::conversion_error(std::string("Cannot cast to boolean: \"") + c + "\"");
}

template <typename Number>
bool
from_number(Number const &n) {
    if (n == 1)
        return true;
    if (n == 0)
        return false;
    throw error::conversion_error("Cannot cast to boolean: \"" + *to_text(value(n)) +
                                  "\"");
}

/**
 * @brief Convert a numeric alternative held by `in`, if any of `From...`
 */
template <typename To, typename... From>
std::optional<value>
narrow_from(value const &in) {
    std::optional<value> result;
    ((in.holds<From>() && !result
          ? (void)(result = value(static_cast<To>(in.get<From>())))
          : (void)0),
     ...);
    return result;
}

value
to_decimal(value const &in) {
    if (auto i = in.get_if<integer>())
        return value(decimal(*i));
    if (auto f = in.get_if<float>())
        return value(decimal(util::format_double(static_cast<double>(*f)).c_str()));
    if (auto d = in.get_if<double>())
        return value(decimal(util::format_double(*d).c_str()));
    return in;
}

value
to_typed_value(value const &in, oid type_oid) {
    std::string const type = type_oid == oid::json ? "json" : "unknown";
    if (auto s = in.get_if<std::string>())
        return value(typed_value{type, *s});
    if (auto c = in.get_if<char>())
        return value(typed_value{type, std::string(1, *c)});
    return in;
}

value
to_character(value const &in) {
    if (auto s = in.get_if<std::string>()) {
        if (s->size() == 1)
            return value(s->front());
    }
    return in;
}

value
to_text_value(value const &in) {
    auto text = to_text(in);
    if (!text)
        return in;
    if (text->size() == 1)
        return value(text->front());
    return value(std::move(*text));
}

template <typename Parser>
value
to_geometry(value const &in, Parser parse) {
    if (auto s = in.get_if<std::string>()) {
        if (auto parsed = parse(*s))
            return value(*parsed);
    }
    return in;
}

value
resolve(value const &in, oid type_oid) {
    switch (type_oid) {
    case oid::int2:
        return narrow_from<smallint, integer, bigint>(in).value_or(in);
    case oid::int4:
        return narrow_from<integer, bigint>(in).value_or(in);
    case oid::int8:
    case oid::oid_t:
        return narrow_from<bigint, integer>(in).value_or(in);
    case oid::float4:
        return narrow_from<float, double, integer, bigint>(in).value_or(in);
    case oid::float8:
        return narrow_from<double, float, integer, bigint>(in).value_or(in);
    case oid::numeric:
        return to_decimal(in);
    case oid::boolean:
    case oid::bit:
        try {
            return value(cast_to_boolean(in));
        } catch (error::conversion_error const &) {
            return in;
        }
    case oid::char_:
    case oid::bpchar:
    case oid::varchar:
        return to_character(in);
    case oid::text:
        return to_text_value(in);
    case oid::point:
        return to_geometry(in, [](std::string const &s) { return parse_point(s); });
    case oid::box:
        return to_geometry(in, [](std::string const &s) { return parse_box(s); });
    case oid::varbit:
    case oid::json:
        return to_typed_value(in, type_oid);
    default:
        return in;
    }
}

} // namespace

value
coerce(value in, oid type_oid) {
    if (in.is_null())
        return in;
    try {
        return resolve(in, type_oid);
    } catch (std::exception const &e) {
        LOG_DEBUG("[pgtext] Coercion of " << in << " to " << type_oid
                                          << " failed: " << e.what());
    }
    return in;
}

bool
cast_to_boolean(value const &in) {
    if (auto b = in.get_if<bool>())
        return *b;
    if (auto s = in.get_if<std::string>())
        return from_string(*s);
    if (auto c = in.get_if<char>())
        return from_char(*c);
    if (auto n = in.get_if<smallint>())
        return from_number(*n);
    if (auto n = in.get_if<integer>())
        return from_number(*n);
    if (auto n = in.get_if<bigint>())
        return from_number(*n);
    if (auto n = in.get_if<float>())
        return from_number(*n);
    if (auto n = in.get_if<double>())
        return from_number(*n);
    if (auto n = in.get_if<decimal>())
        return from_number(*n);
    throw error::conversion_error("Cannot cast to boolean: \"" +
                                  to_text(in).value_or("null") + "\"");
}

} // namespace pgtext
} // namespace qb
