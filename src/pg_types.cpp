/**
 * @file pg_types.cpp
 * @brief Implementation of PostgreSQL type utilities
 *
 * This file implements the OID name table shared by the stream operators and
 * the built-in type catalog.
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
#include <map>
#include <type_traits>

#include "./pg_types.h"

namespace qb {
namespace pgtext {

namespace {
/**
 * @brief Mapping from OID enum values to their pg_type names
 */
const std::map<oid, std::string> OID_TO_STRING{
    {oid::boolean, "bool"},
    {oid::bytea, "bytea"},
    {oid::char_, "char"},
    {oid::name, "name"},
    {oid::int8, "int8"},
    {oid::int2, "int2"},
    {oid::int4, "int4"},
    {oid::text, "text"},
    {oid::oid_t, "oid"},
    {oid::json, "json"},
    {oid::xml, "xml"},
    {oid::point, "point"},
    {oid::lseg, "lseg"},
    {oid::path, "path"},
    {oid::box, "box"},
    {oid::polygon, "polygon"},
    {oid::line, "line"},
    {oid::float4, "float4"},
    {oid::float8, "float8"},
    {oid::unknown, "unknown"},
    {oid::circle, "circle"},
    {oid::cash, "money"},
    {oid::macaddr, "macaddr"},
    {oid::inet, "inet"},
    {oid::cidr, "cidr"},
    {oid::int2_array, "_int2"},
    {oid::int4_array, "_int4"},
    {oid::text_array, "_text"},
    {oid::float4_array, "_float4"},
    {oid::bpchar, "bpchar"},
    {oid::varchar, "varchar"},
    {oid::date, "date"},
    {oid::time, "time"},
    {oid::timestamp, "timestamp"},
    {oid::timestamptz, "timestamptz"},
    {oid::interval, "interval"},
    {oid::timetz, "timetz"},
    {oid::bit, "bit"},
    {oid::varbit, "varbit"},
    {oid::numeric, "numeric"},
    {oid::record, "record"},
    {oid::record_array, "_record"},
    {oid::uuid, "uuid"},
    {oid::jsonb, "jsonb"},
};

/**
 * @brief Reverse lookup, built once from OID_TO_STRING
 */
const std::map<std::string, oid> &
string_to_oid() {
    static const std::map<std::string, oid> STRING_TO_OID = [] {
        std::map<std::string, oid> result;
        for (auto const &entry : OID_TO_STRING)
            result.emplace(entry.second, entry.first);
        return result;
    }();
    return STRING_TO_OID;
}

} // namespace

std::ostream &
operator<<(std::ostream &out, oid val) {
    std::ostream::sentry s(out);
    if (s) {
        auto it = OID_TO_STRING.find(val);
        if (it != OID_TO_STRING.end()) {
            out << it->second;
        } else {
            out << "oid_" << static_cast<std::underlying_type_t<oid>>(val);
        }
    }
    return out;
}

std::istream &
operator>>(std::istream &in, oid &val) {
    std::istream::sentry s(in);
    if (s) {
        std::string name;
        if (in >> name) {
            auto const &names = string_to_oid();
            auto        it    = names.find(name);
            if (it != names.end()) {
                val = it->second;
            } else {
                in.setstate(std::ios_base::failbit);
            }
        }
    }
    return in;
}

std::optional<std::string>
builtin_type_catalog::type_name(oid type_oid) const {
    auto it = OID_TO_STRING.find(type_oid);
    if (it == OID_TO_STRING.end())
        return std::nullopt;
    return it->second;
}

} // namespace pgtext
} // namespace qb
