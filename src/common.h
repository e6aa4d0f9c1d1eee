/**
 * @file common.h
 * @brief Common types and utilities for the PostgreSQL text-literal codec
 *
 * This file contains the core definitions shared by the codec components:
 *
 * - Client configuration options and their standard keys
 * - Target representation kinds for caller-directed re-typing
 * - Forward declarations and pointer types
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

#ifndef QBM_PGTEXT_COMMON_H
#define QBM_PGTEXT_COMMON_H

#include <iosfwd>
#include <map>
#include <memory>
#include <string>

#include "./pg_types.h"

namespace qb {
namespace pgtext {

/**
 * @brief Representation kinds a composite attribute can be re-typed to
 *
 * Only integer, bigint, double_precision, decimal, string, boolean and
 * timestamp have a conversion. The remaining kinds exist so that a request
 * for them can be named in the resulting error.
 */
enum class target_kind {
    integer,          /**< 4-byte integer */
    bigint,           /**< 8-byte integer */
    double_precision, /**< 8-byte floating-point number */
    decimal,          /**< Arbitrary precision decimal */
    string,           /**< Text */
    boolean,          /**< Boolean */
    timestamp,        /**< Date and time */
    smallint,         /**< 2-byte integer, no conversion */
    real,             /**< 4-byte floating-point number, no conversion */
    bytes,            /**< Binary data, no conversion */
    date,             /**< Date, no conversion */
    time,             /**< Time of day, no conversion */
    character         /**< Single character, no conversion */
};

/**
 * @brief Stream output operator for target kinds
 *
 * Outputs the name of the kind, e.g. "double precision".
 */
::std::ostream &operator<<(::std::ostream &os, target_kind val);

/**
 * @brief Client configuration options
 *
 * Map of key-value pairs for configuring the codec session.
 */
using client_options_type = std::map<std::string, std::string>;

/**
 * @brief Mapping from a declared type name to the kind it should be read as
 */
using type_map = std::map<std::string, target_kind>;

//@{
/** @name Forward declarations */
class composite_value;
class struct_descriptor;
class session_context;
//@}

//@{
/** @name Pointer types */
using struct_descriptor_ptr = std::shared_ptr<const struct_descriptor>;
using session_ptr           = std::shared_ptr<const session_context>;
//@}

/**
 * @brief Namespace containing configuration option keys
 */
namespace options {

/**
 * @brief Character encoding for client-server communication
 */
const std::string CLIENT_ENCODING = "client_encoding";

/**
 * @brief Time zone used as the default calendar of the session
 */
const std::string TIMEZONE = "timezone";

} // namespace options

} // namespace pgtext
} // namespace qb

#endif /* QBM_PGTEXT_COMMON_H */
