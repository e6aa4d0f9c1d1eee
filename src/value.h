/**
 * @file value.h
 * @brief Dynamically typed attribute value of a composite
 *
 * A composite value carries one `value` per attribute. Before coercion the
 * value holds whatever native shape the reader produced (usually a string);
 * after coercion it holds the shape matching the attribute's declared type.
 *
 * Supported alternatives:
 * - null (`std::monostate`)
 * - `bool`, `char`
 * - `smallint`, `integer`, `bigint`, `float`, `double`, `decimal`
 * - `std::string`, `bytea`
 * - `point`, `box`, `typed_value`
 * - `date`, `time_of_day`, `timestamp`
 * - `composite_ref` (nested composite value)
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

#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <qb/json.h>

#include "./common.h"
#include "./error.h"
#include "./geometric.h"
#include "./pg_types.h"
#include "./temporal.h"

namespace qb {
namespace pgtext {

/**
 * @brief Arbitrary precision decimal, matches PostgreSQL `numeric` type
 */
using decimal = boost::multiprecision::cpp_dec_float_50;

/**
 * @brief Opaque value of a vendor type, a type label and its text
 *
 * Used for `json` and bit string attributes, which are carried as text.
 */
struct typed_value {
    std::string                type;
    std::optional<std::string> value;

    /**
     * @brief Parse the text as JSON
     * @throws error::conversion_error if there is no text or it is not JSON
     */
    qb::json json() const;

    bool
    operator==(typed_value const &rhs) const {
        return type == rhs.type && value == rhs.value;
    }
    bool
    operator!=(typed_value const &rhs) const {
        return !(*this == rhs);
    }
};

/**
 * @brief Shared handle on a nested composite value
 *
 * Compared and hashed by the composite content, not by address.
 */
struct composite_ref {
    std::shared_ptr<const composite_value> ptr;

    bool operator==(composite_ref const &rhs) const;
    bool
    operator!=(composite_ref const &rhs) const {
        return !(*this == rhs);
    }
};

/**
 * @brief Attribute value of a composite
 */
class value {
public:
    using variant_type =
        std::variant<std::monostate, bool, char, smallint, integer, bigint, float,
                     double, decimal, std::string, bytea, point, box, typed_value,
                     date, time_of_day, timestamp, composite_ref>;

    /** @brief Null value */
    value() = default;

    value(bool v)
        : _data(v) {}
    value(char v)
        : _data(v) {}
    value(smallint v)
        : _data(v) {}
    value(integer v)
        : _data(v) {}
    value(bigint v)
        : _data(v) {}
    value(float v)
        : _data(v) {}
    value(double v)
        : _data(v) {}
    value(decimal v)
        : _data(std::move(v)) {}
    value(std::string v)
        : _data(std::move(v)) {}
    value(char const *v)
        : _data(std::string(v)) {}
    value(bytea v)
        : _data(std::move(v)) {}
    value(point v)
        : _data(v) {}
    value(box v)
        : _data(v) {}
    value(typed_value v)
        : _data(std::move(v)) {}
    value(date v)
        : _data(v) {}
    value(time_of_day v)
        : _data(std::move(v)) {}
    value(timestamp v)
        : _data(std::move(v)) {}
    value(composite_ref v)
        : _data(std::move(v)) {}

    bool
    is_null() const {
        return std::holds_alternative<std::monostate>(_data);
    }

    template <typename T>
    bool
    holds() const {
        return std::holds_alternative<T>(_data);
    }

    /**
     * @brief Access the held alternative
     * @throws error::conversion_error if the value holds another alternative
     */
    template <typename T>
    T const &
    get() const {
        if (auto p = std::get_if<T>(&_data))
            return *p;
        throw error::conversion_error("Value does not hold the requested type");
    }

    template <typename T>
    T const *
    get_if() const {
        return std::get_if<T>(&_data);
    }

    variant_type const &
    data() const {
        return _data;
    }

    std::size_t hash() const;

    bool
    operator==(value const &rhs) const {
        return _data == rhs._data;
    }
    bool
    operator!=(value const &rhs) const {
        return !(*this == rhs);
    }

private:
    variant_type _data;
};

/**
 * @brief String form of a value
 *
 * Numbers use their shortest round-trip form, booleans `true`/`false`, binary
 * data `\x` hex and nested composites their rendered literal.
 *
 * @return The text, or std::nullopt for null and for values without text
 */
std::optional<std::string> to_text(value const &v);

std::ostream &operator<<(std::ostream &os, value const &v);

} // namespace pgtext
} // namespace qb

namespace std {

template <>
struct hash<qb::pgtext::value> {
    std::size_t
    operator()(qb::pgtext::value const &v) const {
        return v.hash();
    }
};

} // namespace std
