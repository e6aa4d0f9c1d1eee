/**
 * @file pg_types.h
 * @brief PostgreSQL data types and OID definitions for the text-literal codec
 *
 * This file contains the type definitions that map PostgreSQL data types to C++
 * types, along with the Object Identifier (OID) values of the built-in data types
 * the codec knows about. It provides the foundation for coercion and rendering of
 * composite and array literals.
 *
 * The file includes:
 * - Mappings for basic numeric types (smallint, integer, bigint)
 * - Binary data (bytea) definition
 * - OID enumeration for the standard PostgreSQL data types
 * - Type catalog interface resolving an OID to its type name
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

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace qb {
namespace pgtext {

/**
 * @brief 2-byte integer, to match PostgreSQL `smallint` and `smallserial` types
 */
using smallint = int16_t;
/**
 * @brief 4-byte integer, to match PostgreSQL `integer` and `serial` types
 */
using integer = int32_t;
/**
 * @brief 8-byte integer, to match PostgreSQL `bigint` and `bigserial` types
 */
using bigint = int64_t;

/**
 * @brief 1-byte char or byte type.
 */
using byte = char;

/**
 * @brief Binary data, matches PostgreSQL `bytea` type
 *
 * Represents arbitrary binary data stored in a vector.
 */
struct bytea : std::vector<byte> {
    using base_type = std::vector<byte>;

    bytea()
        : base_type() {}

    bytea(std::initializer_list<byte> args)
        : base_type(args) {}

    template <typename InputIterator>
    bytea(InputIterator first, InputIterator last)
        : base_type(first, last) {}

    void
    swap(bytea &rhs) {
        base_type::swap(rhs);
    }
};

/**
 * @brief Nullable data type wrapper
 *
 * Represents PostgreSQL's NULL value concept for a single field.
 */
template <typename T>
using nullable = std::optional<T>;

/**
 * @brief Object Identifier (OID) enumeration for PostgreSQL data types
 *
 * Contains the standard OIDs for the built-in PostgreSQL data types.
 * These values match those in the pg_type system catalog table. The codec
 * dispatches coercion and rendering on these values.
 */
enum class oid : int {
    boolean      = 16,   /**< Boolean type (true/false) */
    bytea        = 17,   /**< Variable-length binary data */
    char_        = 18,   /**< Single character */
    name         = 19,   /**< System identifier (limited-length string) */
    int8         = 20,   /**< 8-byte integer (bigint) */
    int2         = 21,   /**< 2-byte integer (smallint) */
    int4         = 23,   /**< 4-byte integer (integer) */
    text         = 25,   /**< Variable-length string */
    oid_t        = 26,   /**< Object identifier type, used as row id */
    json         = 114,  /**< JSON data */
    xml          = 142,  /**< XML data */
    point        = 600,  /**< Geometric point (x,y) */
    lseg         = 601,  /**< Geometric line segment */
    path         = 602,  /**< Geometric path */
    box          = 603,  /**< Geometric box */
    polygon      = 604,  /**< Geometric polygon */
    line         = 628,  /**< Geometric line */
    float4       = 700,  /**< 4-byte floating-point number */
    float8       = 701,  /**< 8-byte floating-point number */
    unknown      = 705,  /**< Unknown type */
    circle       = 718,  /**< Geometric circle */
    cash         = 790,  /**< Monetary amount */
    macaddr      = 829,  /**< MAC address */
    inet         = 869,  /**< IPv4 or IPv6 address */
    cidr         = 650,  /**< IPv4 or IPv6 network */
    int2_array   = 1005, /**< Array of int2 */
    int4_array   = 1007, /**< Array of int4 */
    text_array   = 1009, /**< Array of text */
    float4_array = 1021, /**< Array of float4 */
    bpchar       = 1042, /**< Blank-padded string (char(n)) */
    varchar      = 1043, /**< Variable-length string with limit (varchar(n)) */
    date         = 1082, /**< Date */
    time         = 1083, /**< Time of day */
    timestamp    = 1114, /**< Date and time */
    timestamptz  = 1184, /**< Date and time with time zone */
    interval     = 1186, /**< Time interval */
    timetz       = 1266, /**< Time of day with time zone */
    bit          = 1560, /**< Fixed-length bit string */
    varbit       = 1562, /**< Variable-length bit string */
    numeric      = 1700, /**< Exact numeric with selectable precision */
    record       = 2249, /**< Anonymous composite type */
    record_array = 2287, /**< Array of records */
    uuid         = 2950, /**< Universally unique identifier */
    jsonb        = 3802  /**< Binary JSON data */
};

/**
 * @brief Output stream operator for OID values
 *
 * OIDs are output as their catalog type name (e.g. "int4" for oid::int4).
 * Unknown values are output as "oid_X" where X is the numeric value.
 */
std::ostream &operator<<(std::ostream &out, oid val);

/**
 * @brief Input stream operator for OID values
 *
 * Reads a catalog type name and sets the failbit if it is not known.
 */
std::istream &operator>>(std::istream &in, oid &val);

/**
 * @brief Type catalog lookup
 *
 * Resolves a type OID to the name of the type as the server's pg_type
 * catalog knows it. The session normally provides an implementation backed by
 * the server catalog; builtin_type_catalog covers the standard types.
 */
class type_catalog {
public:
    virtual ~type_catalog() = default;

    /**
     * @brief Get the name of a type
     * @param type_oid OID to resolve
     * @return The type name, or std::nullopt when the OID is not known
     */
    virtual std::optional<std::string> type_name(oid type_oid) const = 0;
};

/**
 * @brief Catalog of the PostgreSQL built-in types
 */
class builtin_type_catalog : public type_catalog {
public:
    std::optional<std::string> type_name(oid type_oid) const override;
};

} // namespace pgtext
} // namespace qb
