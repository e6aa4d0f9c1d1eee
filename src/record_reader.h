/**
 * @file record_reader.h
 * @brief Sequential typed reader over the fields of a composite literal
 *
 * Reads the fields of a composite literal one after the other into C++
 * variables, without building a composite_value first. This is the way to
 * map a row value onto a user structure:
 *
 * @code
 * struct inventory_item {
 *     std::string                   name;
 *     qb::pgtext::integer           supplier_id;
 *     std::optional<qb::pgtext::decimal> price;
 * };
 *
 * qb::pgtext::record_reader reader("(\"fuzzy dice\",42,)");
 * inventory_item item;
 * reader.read(item.name) && reader.read(item.supplier_id) && reader.read(item.price);
 * @endcode
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

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "./common.h"
#include "./error.h"
#include "./literal_scanner.h"
#include "./session.h"
#include "./value.h"

namespace qb {
namespace pgtext {

/**
 * @brief Reader of composite literal fields
 *
 * Every read consumes one field. A null field can only be read into a
 * std::optional; a field that cannot be converted to the requested type makes
 * the read fail without stopping the reader.
 */
class record_reader {
public:
    /**
     * @brief Reader over the fields of a composite literal `(a,b,...)`
     * @param literal Literal text
     * @param session Session used for date/time fields, the default one if null
     */
    explicit record_reader(std::string_view literal, session_ptr session = nullptr);

    /**
     * @brief Reader over already scanned fields
     */
    explicit record_reader(token_list tokens, session_ptr session = nullptr);

    /**
     * @brief Whether fields can be read into T, std::optional excluded
     */
    template <typename T>
    static inline constexpr bool is_readable_v =
        std::disjunction_v<std::is_same<T, smallint>, std::is_same<T, integer>,
                           std::is_same<T, bigint>, std::is_same<T, float>,
                           std::is_same<T, double>, std::is_same<T, bool>,
                           std::is_same<T, std::string>, std::is_same<T, decimal>,
                           std::is_same<T, bytea>, std::is_same<T, date>,
                           std::is_same<T, time_of_day>, std::is_same<T, timestamp>,
                           std::is_same<T, point>, std::is_same<T, box>>;

    /**
     * @brief Read the next field
     *
     * @tparam T One of smallint, integer, bigint, float, double, bool,
     * std::string, decimal, bytea, date, time_of_day, timestamp, point, box,
     * or a std::optional of those
     * @param value Variable to fill
     * @return true if the field was read, false at the end of the record, for
     * a null field read into a non-optional type or for text not valid for T
     */
    template <typename T>
    bool
    read(T &value) {
        if constexpr (is_optional_v<T>)
            static_assert(is_readable_v<typename T::value_type>,
                          "record_reader cannot read this field type");
        else
            static_assert(is_readable_v<T>, "record_reader cannot read this field type");

        if (_position >= _tokens.size()) {
            _was_null = false;
            return false;
        }
        auto const &field = _tokens[_position++];
        _was_null         = !field.has_value();
        if (_was_null) {
            if constexpr (is_optional_v<T>) {
                value.reset();
                return true;
            } else {
                return false;
            }
        }
        if constexpr (is_optional_v<T>) {
            typename T::value_type inner{};
            if (!read_text(*field, inner))
                return false;
            value = std::move(inner);
            return true;
        } else {
            return read_text(*field, value);
        }
    }

    /**
     * @brief Read the next field and return it
     * @throws error::client_error if there are no more fields
     * @throws error::value_is_null if the field is null and T is not optional
     * @throws error::conversion_error if the text is not valid for T
     */
    template <typename T>
    T
    get() {
        if (remaining() == 0)
            throw error::client_error("No more fields in record");
        auto const index = _position;
        T          result{};
        if (!read(result)) {
            if (_was_null)
                throw error::value_is_null("#" + std::to_string(index));
            throw error::conversion_error("Cannot read field #" + std::to_string(index) +
                                          " value \"" + *_tokens[index] + "\"");
        }
        return result;
    }

    /**
     * @brief Whether the last field read was null
     */
    bool
    was_null() const {
        return _was_null;
    }

    /**
     * @brief Number of fields not read yet
     */
    std::size_t
    remaining() const {
        return _tokens.size() - _position;
    }

    /**
     * @brief Skip the next field
     */
    void
    skip() {
        if (_position < _tokens.size())
            ++_position;
    }

private:
    template <typename T>
    struct is_optional : std::false_type {};

    template <typename T>
    struct is_optional<std::optional<T>> : std::true_type {};

    template <typename T>
    static inline constexpr bool is_optional_v = is_optional<T>::value;

    bool read_text(std::string const &text, smallint &value) const;
    bool read_text(std::string const &text, integer &value) const;
    bool read_text(std::string const &text, bigint &value) const;
    bool read_text(std::string const &text, float &value) const;
    bool read_text(std::string const &text, double &value) const;
    bool read_text(std::string const &text, bool &value) const;
    bool read_text(std::string const &text, std::string &value) const;
    bool read_text(std::string const &text, decimal &value) const;
    bool read_text(std::string const &text, bytea &value) const;
    bool read_text(std::string const &text, date &value) const;
    bool read_text(std::string const &text, time_of_day &value) const;
    bool read_text(std::string const &text, timestamp &value) const;
    bool read_text(std::string const &text, point &value) const;
    bool read_text(std::string const &text, box &value) const;

    token_list  _tokens;
    session_ptr _session;
    std::size_t _position = 0;
    bool        _was_null = false;
};

} // namespace pgtext
} // namespace qb
