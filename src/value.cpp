/**
 * @file value.cpp
 * @brief Implementation of attribute value hashing and text forms
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
#include <type_traits>

#include <boost/container_hash/hash.hpp>

#include "./composite.h"
#include "./util/text_format.h"
#include "./value.h"

namespace qb {
namespace pgtext {

namespace {

template <typename T>
struct always_false : std::false_type {};

std::string
to_hex(bytea const &data) {
    static char const digits[] = "0123456789abcdef";
    std::string       out("\\x");
    out.reserve(2 + data.size() * 2);
    for (auto c : data) {
        auto const b = static_cast<unsigned char>(c);
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

std::size_t
hash_date(date const &d) {
    std::size_t seed = 0;
    boost::hash_combine(seed, d.year);
    boost::hash_combine(seed, d.month);
    boost::hash_combine(seed, d.day);
    return seed;
}

std::size_t
hash_time(time_of_day const &t) {
    std::size_t seed = 0;
    boost::hash_combine(seed, t.hour);
    boost::hash_combine(seed, t.minute);
    boost::hash_combine(seed, t.second);
    boost::hash_combine(seed, t.microsecond);
    boost::hash_combine(seed, t.utc_offset.value_or(0));
    boost::hash_combine(seed, t.utc_offset.has_value());
    return seed;
}

struct alternative_hasher {
    std::size_t
    operator()(std::monostate) const {
        return 0;
    }
    std::size_t
    operator()(decimal const &v) const {
        return boost::hash_value(v.str());
    }
    std::size_t
    operator()(bytea const &v) const {
        return boost::hash_range(v.begin(), v.end());
    }
    std::size_t
    operator()(point const &v) const {
        std::size_t seed = 0;
        boost::hash_combine(seed, v.x);
        boost::hash_combine(seed, v.y);
        return seed;
    }
    std::size_t
    operator()(box const &v) const {
        std::size_t seed = (*this)(v.first);
        boost::hash_combine(seed, (*this)(v.second));
        return seed;
    }
    std::size_t
    operator()(typed_value const &v) const {
        std::size_t seed = boost::hash_value(v.type);
        boost::hash_combine(seed, v.value.value_or(std::string()));
        boost::hash_combine(seed, v.value.has_value());
        return seed;
    }
    std::size_t
    operator()(date const &v) const {
        return hash_date(v);
    }
    std::size_t
    operator()(time_of_day const &v) const {
        return hash_time(v);
    }
    std::size_t
    operator()(timestamp const &v) const {
        std::size_t seed = static_cast<std::size_t>(v.special);
        if (v.special == timestamp::special_value::none) {
            boost::hash_combine(seed, hash_date(v.day));
            boost::hash_combine(seed, hash_time(v.time));
        }
        return seed;
    }
    std::size_t
    operator()(composite_ref const &v) const {
        return v.ptr ? v.ptr->hash() : 0;
    }
    template <typename T>
    std::size_t
    operator()(T const &v) const {
        return boost::hash_value(v);
    }
};

} // namespace

qb::json
typed_value::json() const {
    if (!value)
        throw error::conversion_error("No JSON text in value of type " + type);
    try {
        return qb::json::parse(*value);
    } catch (std::exception const &e) {
        throw error::conversion_error(std::string("Failed to parse JSON text: ") +
                                      e.what());
    }
}

bool
composite_ref::operator==(composite_ref const &rhs) const {
    if (ptr == rhs.ptr)
        return true;
    if (!ptr || !rhs.ptr)
        return false;
    return *ptr == *rhs.ptr;
}

std::size_t
value::hash() const {
    std::size_t seed = _data.index();
    boost::hash_combine(seed, std::visit(alternative_hasher{}, _data));
    return seed;
}

std::optional<std::string>
to_text(value const &v) {
    return std::visit(
        [](auto const &alt) -> std::optional<std::string> {
            using T = std::decay_t<decltype(alt)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, bool>) {
                return std::string(alt ? "true" : "false");
            } else if constexpr (std::is_same_v<T, char>) {
                return std::string(1, alt);
            } else if constexpr (std::is_same_v<T, smallint> ||
                                 std::is_same_v<T, integer> ||
                                 std::is_same_v<T, bigint>) {
                return std::to_string(alt);
            } else if constexpr (std::is_same_v<T, float>) {
                return util::format_float(alt);
            } else if constexpr (std::is_same_v<T, double>) {
                return util::format_double(alt);
            } else if constexpr (std::is_same_v<T, decimal>) {
                return alt.str();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return alt;
            } else if constexpr (std::is_same_v<T, bytea>) {
                return to_hex(alt);
            } else if constexpr (std::is_same_v<T, point> || std::is_same_v<T, box> ||
                                 std::is_same_v<T, date> ||
                                 std::is_same_v<T, time_of_day> ||
                                 std::is_same_v<T, timestamp>) {
                return to_string(alt);
            } else if constexpr (std::is_same_v<T, typed_value>) {
                return alt.value;
            } else if constexpr (std::is_same_v<T, composite_ref>) {
                if (!alt.ptr)
                    return std::nullopt;
                return alt.ptr->render();
            } else {
                static_assert(always_false<T>::value, "unhandled value alternative");
            }
        },
        v.data());
}

std::ostream &
operator<<(std::ostream &os, value const &v) {
    auto text = to_text(v);
    if (text)
        os << *text;
    else
        os << "null";
    return os;
}

} // namespace pgtext
} // namespace qb
