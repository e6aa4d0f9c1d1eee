/**
 * @file type_coercion.h
 * @brief Re-typing of attribute values to the shape of their declared type
 *
 * Attribute values usually reach a composite in whatever shape the caller had
 * at hand: an `int8` column may receive a 4-byte integer, a `point` column a
 * plain string. coerce() normalizes such values to the native shape of the
 * declared type OID. It is a pure function and never throws; a value it does
 * not know how to convert is returned unchanged.
 *
 * | OID                           | Accepted input                 | Result          |
 * |-------------------------------|--------------------------------|-----------------|
 * | `int2`                        | integer, bigint                | smallint        |
 * | `int4`                        | bigint                         | integer         |
 * | `int8`, `oid`                 | integer                        | bigint          |
 * | `float4`                      | double, integer, bigint        | float           |
 * | `float8`                      | float, integer, bigint         | double          |
 * | `numeric`                     | integer, float, double         | decimal         |
 * | `bool`, `bit`                 | see cast_to_boolean()          | bool            |
 * | `char`, `bpchar`, `varchar`   | one byte string                | char            |
 * | `text`                        | any                            | char or string  |
 * | `point`, `box`                | string                         | point, box      |
 * | `varbit`, `json`              | string, char                   | typed_value     |
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

#include "./pg_types.h"
#include "./value.h"

namespace qb {
namespace pgtext {

/**
 * @brief Convert a value to the native shape of a type OID
 * @param in Value to convert
 * @param type_oid Declared type of the attribute
 * @return The converted value, or `in` unchanged when no rule applies
 */
value coerce(value in, oid type_oid);

/**
 * @brief Interpret a value as a boolean
 *
 * - `bool` is returned as is
 * - strings are trimmed and compared without case against
 *   `1 true t yes y on` and `0 false f no n off`
 * - characters `1 t T y Y` and `0 f F n N`
 * - numbers equal to 1 or 0
 *
 * @throws error::conversion_error if the value is none of the above
 */
bool cast_to_boolean(value const &in);

} // namespace pgtext
} // namespace qb
