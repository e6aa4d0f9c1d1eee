/**
 * @file common.cpp
 * @brief Implementation of common codec utilities
 *
 * This file implements the functionality declared in common.h, including
 * the display names of the re-typing target kinds.
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

#include "./common.h"

namespace qb {
namespace pgtext {

namespace {
/**
 * @brief Mapping from target kinds to their display names
 */
const std::map<target_kind, std::string> KIND_TO_STRING{
    {target_kind::integer, "integer"},
    {target_kind::bigint, "bigint"},
    {target_kind::double_precision, "double precision"},
    {target_kind::decimal, "numeric"},
    {target_kind::string, "text"},
    {target_kind::boolean, "boolean"},
    {target_kind::timestamp, "timestamp"},
    {target_kind::smallint, "smallint"},
    {target_kind::real, "real"},
    {target_kind::bytes, "bytea"},
    {target_kind::date, "date"},
    {target_kind::time, "time"},
    {target_kind::character, "char"},
}; // KIND_TO_STRING
} // namespace

::std::ostream &
operator<<(::std::ostream &os, target_kind val) {
    std::ostream::sentry s(os);
    if (s) {
        auto f = KIND_TO_STRING.find(val);
        if (f != KIND_TO_STRING.end()) {
            os << f->second;
        } else {
            os << "Unknown target kind " << static_cast<int>(val);
        }
    }
    return os;
}

} // namespace pgtext
} // namespace qb
