/**
 * @file error.h
 * @brief Error classes for the PostgreSQL text-literal codec
 *
 * This file declares the exception hierarchy used by the codec:
 *
 * - Base database errors (db_error)
 * - Client-side errors (client_error)
 * - Value conversion errors (conversion_error)
 * - Unsupported re-typing requests (unsupported_conversion)
 * - NULL value access errors (value_is_null)
 *
 * Literal scanning and value coercion never throw; these errors surface only
 * where the caller states an explicit, checkable expectation.
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

#include <stdexcept>
#include <string>

#include "./common.h"

namespace qb {
namespace pgtext {
namespace error {

/**
 * @brief Base class for all errors raised by the codec
 */
class db_error : public std::runtime_error {
public:
    explicit db_error(std::string const &what_arg);
    explicit db_error(char const *what_arg);
};

/**
 * @brief Error caused by the client side, e.g. an attribute count mismatch
 */
class client_error : public db_error {
public:
    explicit client_error(std::string const &what_arg);
    explicit client_error(char const *what_arg);
};

/**
 * @brief A value could not be converted to the requested representation
 *
 * Raised by the temporal parser, the boolean cast and the re-typing of
 * composite attributes when the text of a value is malformed.
 */
class conversion_error : public client_error {
public:
    explicit conversion_error(std::string const &what_arg);
    explicit conversion_error(char const *what_arg);
};

/**
 * @brief The requested target representation is outside the conversion table
 *
 * Carries the requested kind so callers can report it.
 */
class unsupported_conversion : public conversion_error {
public:
    explicit unsupported_conversion(target_kind requested);

    /**
     * @brief The representation kind that was requested
     */
    target_kind
    requested() const {
        return _requested;
    }

private:
    target_kind _requested;
};

/**
 * @brief A NULL value was read into a type that cannot hold it
 */
class value_is_null : public client_error {
public:
    explicit value_is_null(std::string const &field_name);
};

} // namespace error
} // namespace pgtext
} // namespace qb
