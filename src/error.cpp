/**
 * @file error.cpp
 * @brief Implementation of the codec error classes
 *
 * This file implements the exception classes declared in error.h. Each
 * constructor builds the message reported by what().
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

#include <sstream>

#include "./error.h"

namespace qb {
namespace pgtext {
namespace error {

namespace {

std::string
unsupported_message(target_kind requested) {
    std::ostringstream os;
    os << "Unsupported conversion to " << requested << ".";
    return os.str();
}

} // namespace

db_error::db_error(std::string const &what_arg)
    : std::runtime_error(what_arg) {}

db_error::db_error(char const *what_arg)
    : std::runtime_error(what_arg) {}

client_error::client_error(std::string const &what_arg)
    : db_error(what_arg) {}

client_error::client_error(char const *what_arg)
    : db_error(what_arg) {}

conversion_error::conversion_error(std::string const &what_arg)
    : client_error(what_arg) {}

conversion_error::conversion_error(char const *what_arg)
    : client_error(what_arg) {}

/**
 * @brief Builds "Unsupported conversion to <kind>." from the requested kind
 */
unsupported_conversion::unsupported_conversion(target_kind requested)
    : conversion_error(unsupported_message(requested))
    , _requested(requested) {}

value_is_null::value_is_null(std::string const &field_name)
    : client_error("Value of field " + field_name + " is null") {}

} // namespace error
} // namespace pgtext
} // namespace qb
