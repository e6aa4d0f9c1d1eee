/**
 * @file composite.cpp
 * @brief Implementation of composite values and descriptors
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

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>

#include <boost/container_hash/hash.hpp>
#include <qb/io.h>

#include "./composite.h"
#include "./error.h"
#include "./literal_scanner.h"
#include "./type_coercion.h"
#include "./util/text_format.h"

namespace qb {
namespace pgtext {

namespace {

[[noreturn]] void
bad_value(char const *type_name, std::string const &text) {
    throw error::conversion_error(std::string("Bad value for type ") + type_name +
                                  " : " + text);
}

std::optional<decimal>
parse_decimal(std::string const &text) {
    std::string const trimmed(util::trim(text));
    if (!util::is_numeric_literal(trimmed))
        return std::nullopt;
    try {
        return decimal(trimmed.c_str());
    } catch (std::runtime_error const &) {
        return std::nullopt;
    }
}

/**
 * @brief Integer from text, decimal text is truncated toward zero
 */
template <typename Int>
Int
to_integral(std::string const &text, char const *type_name) {
    std::string const trimmed(util::trim(text));
    if (!trimmed.empty()) {
        char *end = nullptr;
        errno     = 0;
        long long const v = std::strtoll(trimmed.c_str(), &end, 10);
        if (errno == 0 && end == trimmed.c_str() + trimmed.size() &&
            v >= std::numeric_limits<Int>::min() && v <= std::numeric_limits<Int>::max())
            return static_cast<Int>(v);
    }

    auto d = parse_decimal(text);
    if (!d)
        bad_value(type_name, text);
    decimal const truncated = boost::multiprecision::trunc(*d);
    if (truncated < std::numeric_limits<Int>::min() ||
        truncated > std::numeric_limits<Int>::max())
        bad_value(type_name, text);
    return truncated.convert_to<Int>();
}

bool
holds_kind(value const &v, target_kind kind) {
    switch (kind) {
    case target_kind::integer:
        return v.holds<integer>();
    case target_kind::bigint:
        return v.holds<bigint>();
    case target_kind::double_precision:
        return v.holds<double>();
    case target_kind::decimal:
        return v.holds<decimal>();
    case target_kind::string:
        return v.holds<std::string>();
    case target_kind::boolean:
        return v.holds<bool>();
    case target_kind::timestamp:
        return v.holds<timestamp>();
    case target_kind::smallint:
        return v.holds<smallint>();
    case target_kind::real:
        return v.holds<float>();
    case target_kind::bytes:
        return v.holds<bytea>();
    case target_kind::date:
        return v.holds<date>();
    case target_kind::time:
        return v.holds<time_of_day>();
    case target_kind::character:
        return v.holds<char>();
    }
    return false;
}

bool
needs_quoting(std::string const &text) {
    for (char c : text) {
        if (c == '\\' || c == '"' || c == '(' || c == ')' || c == ',' ||
            std::isspace(static_cast<unsigned char>(c)))
            return true;
    }
    return false;
}

/**
 * @brief Every `"` and `\` written twice
 */
std::string
double_quotes_and_backslashes(std::string const &text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\')
            out += c;
        out += c;
    }
    return out;
}

void
append_quoted(std::string &out, std::string const &text) {
    out += '"';
    out += double_quotes_and_backslashes(text);
    out += '"';
}

/**
 * @brief Parse a date/time attribute with the session parser
 */
value
resolve_temporal(value raw, oid type_oid, session_context const &session) {
    auto text = to_text(raw);
    if (!text)
        return raw;
    auto const &cal = session.default_calendar();
    try {
        switch (type_oid) {
        case oid::date:
            return value(session.parser().to_date(cal, *text));
        case oid::time:
        case oid::timetz:
            return value(session.parser().to_time(cal, *text));
        default:
            return value(session.parser().to_timestamp(cal, *text));
        }
    } catch (error::conversion_error const &e) {
        LOG_DEBUG("[pgtext] Skip " << type_oid << " conversion: " << e.what());
    }
    return raw;
}

value
resolve_attribute(value raw, field_descriptor const &field, session_context const &session) {
    if (raw.is_null())
        return raw;
    switch (field.type_oid) {
    case oid::date:
    case oid::time:
    case oid::timetz:
    case oid::timestamp:
    case oid::timestamptz:
        return resolve_temporal(std::move(raw), field.type_oid, session);
    default:
        return coerce(std::move(raw), field.type_oid);
    }
}

} // namespace

struct_descriptor::struct_descriptor(std::string sql_type_name, field_list fields)
    : _sql_type_name(std::move(sql_type_name))
    , _fields(std::move(fields)) {}

field_descriptor const &
struct_descriptor::at(std::size_t index) const {
    if (index >= _fields.size())
        throw error::client_error("Attribute index " + std::to_string(index) +
                                  " is out of range for type " + _sql_type_name);
    return _fields[index];
}

std::optional<std::size_t>
struct_descriptor::index_of(std::string const &name) const {
    for (std::size_t i = 0; i < _fields.size(); ++i) {
        if (_fields[i].name == name)
            return i;
    }
    return std::nullopt;
}

descriptor_cache::descriptor_cache(std::shared_ptr<const type_catalog> catalog)
    : _catalog(std::move(catalog)) {
    if (!_catalog)
        throw error::client_error("Descriptor cache requires a type catalog");
}

struct_descriptor_ptr
descriptor_cache::find(std::string const &sql_type_name) const {
    auto f = _descriptors.find(sql_type_name);
    if (f == _descriptors.end())
        return nullptr;
    return f->second;
}

struct_descriptor_ptr
descriptor_cache::insert(std::string sql_type_name, field_list fields) {
    auto f = _descriptors.find(sql_type_name);
    if (f != _descriptors.end())
        return f->second;
    auto descriptor = std::make_shared<const struct_descriptor>(sql_type_name, std::move(fields));
    _descriptors.emplace(std::move(sql_type_name), descriptor);
    return descriptor;
}

struct_descriptor_ptr
descriptor_cache::resolve(std::string const &sql_type_name, attribute_list const &attributes) {
    if (auto cached = find(sql_type_name))
        return cached;

    field_list fields;
    fields.reserve(attributes.size());
    for (auto const &attr : attributes) {
        auto type_name = _catalog->type_name(attr.second);
        if (!type_name)
            throw error::client_error("Unknown type " + std::to_string(static_cast<int>(attr.second)) +
                                      " for attribute " + attr.first + " of " + sql_type_name);
        fields.push_back(field_descriptor{attr.first, *type_name, attr.second});
    }
    LOG_DEBUG("[pgtext] Register composite type " << sql_type_name << " with "
                                                  << fields.size() << " attributes");
    return insert(sql_type_name, std::move(fields));
}

composite_value::composite_value(struct_descriptor_ptr descriptor, std::vector<value> &&attributes,
                                 session_ptr session)
    : _descriptor(std::move(descriptor))
    , _attributes(std::move(attributes))
    , _session(std::move(session)) {}

composite_value
composite_value::materialize(struct_descriptor_ptr descriptor, std::vector<value> &&raw,
                             session_ptr session) {
    if (!descriptor)
        throw error::client_error("Composite value requires a type descriptor");
    if (raw.size() != descriptor->size())
        throw error::client_error("Composite type " + descriptor->sql_type_name() + " has " +
                                  std::to_string(descriptor->size()) + " attributes, got " +
                                  std::to_string(raw.size()) + " values");
    if (!session)
        session = session_context::default_session();

    std::vector<value> attributes(std::move(raw));
    for (std::size_t i = 0; i < attributes.size(); ++i)
        attributes[i] = resolve_attribute(std::move(attributes[i]), (*descriptor)[i], *session);
    return composite_value(std::move(descriptor), std::move(attributes), std::move(session));
}

composite_value
composite_value::parse(struct_descriptor_ptr descriptor, std::string_view text,
                       session_ptr session) {
    if (!descriptor)
        throw error::client_error("Composite value requires a type descriptor");

    auto const tokens = parse_composite_literal(text);
    if (tokens.size() < descriptor->size()) {
        LOG_DEBUG("[pgtext] Literal of " << descriptor->sql_type_name() << " has "
                                         << tokens.size() << " fields, "
                                         << descriptor->size() - tokens.size()
                                         << " read as null");
    } else if (tokens.size() > descriptor->size()) {
        LOG_DEBUG("[pgtext] Literal of " << descriptor->sql_type_name() << " has "
                                         << tokens.size() << " fields, "
                                         << tokens.size() - descriptor->size() << " ignored");
    }

    std::vector<value> raw;
    raw.reserve(descriptor->size());
    for (std::size_t i = 0; i < descriptor->size(); ++i) {
        if (i < tokens.size() && tokens[i])
            raw.emplace_back(*tokens[i]);
        else
            raw.emplace_back();
    }
    return materialize(std::move(descriptor), std::move(raw), std::move(session));
}

value const &
composite_value::attribute(std::string const &name) const {
    auto index = _descriptor->index_of(name);
    if (!index)
        throw error::client_error("Composite type " + sql_type_name() + " has no attribute " +
                                  name);
    return _attributes[*index];
}

std::vector<value>
composite_value::attributes_as(type_map const &map) const {
    std::vector<value> result;
    result.reserve(_attributes.size());
    for (std::size_t i = 0; i < _attributes.size(); ++i) {
        auto f = map.find((*_descriptor)[i].type_name);
        if (f == map.end() || _attributes[i].is_null()) {
            result.push_back(_attributes[i]);
            continue;
        }
        result.push_back(attribute_as(_attributes[i], f->second));
    }
    return result;
}

value
composite_value::attribute_as(value const &attribute, target_kind kind) const {
    if (holds_kind(attribute, kind))
        return attribute;

    std::string const text = to_text(attribute).value_or(std::string());
    switch (kind) {
    case target_kind::integer:
        return value(to_integral<integer>(text, "int"));
    case target_kind::bigint:
        return value(to_integral<bigint>(text, "long"));
    case target_kind::double_precision: {
        auto d = util::parse_double(text);
        if (!d)
            bad_value("double", text);
        return value(*d);
    }
    case target_kind::decimal: {
        auto d = parse_decimal(text);
        if (!d)
            bad_value("BigDecimal", text);
        return value(std::move(*d));
    }
    case target_kind::string:
        return value(text);
    case target_kind::boolean:
        return value(cast_to_boolean(value(text)));
    case target_kind::timestamp:
        return value(_session->parser().to_timestamp(std::nullopt, text));
    case target_kind::smallint:
    case target_kind::real:
    case target_kind::bytes:
    case target_kind::date:
    case target_kind::time:
    case target_kind::character:
        break;
    }
    throw error::unsupported_conversion(kind);
}

std::string
composite_value::render() const {
    std::string out("(");
    for (std::size_t i = 0; i < _attributes.size(); ++i) {
        if (i > 0)
            out += ',';

        auto const             &attribute = _attributes[i];
        std::optional<std::string> text;
        if (auto b = attribute.get_if<bytea>()) {
            text = _session->decoder().decode(*b);
        } else if (auto flag = attribute.get_if<bool>();
                   flag && (*_descriptor)[i].type_oid == oid::bit) {
            text = *flag ? "1" : "0";
        } else if (auto nested = attribute.get_if<composite_ref>()) {
            if (nested->ptr)
                text = double_quotes_and_backslashes(nested->ptr->render());
        } else if (auto typed = attribute.get_if<typed_value>();
                   typed && typed->type == "json") {
            if (typed->value) {
                text.emplace();
                for (char c : *typed->value) {
                    if (c == '"')
                        *text += '\\';
                    *text += c;
                }
            }
        } else {
            text = to_text(attribute);
        }

        if (!text)
            continue;
        if (needs_quoting(*text))
            append_quoted(out, *text);
        else
            out += *text;
    }
    out += ')';
    return out;
}

std::size_t
composite_value::hash() const {
    std::size_t seed = boost::hash_value(sql_type_name());
    for (auto const &attribute : _attributes)
        boost::hash_combine(seed, attribute.hash());
    return seed;
}

bool
composite_value::operator==(composite_value const &rhs) const {
    if (this == &rhs)
        return true;
    return sql_type_name() == rhs.sql_type_name() && _attributes == rhs._attributes;
}

std::ostream &
operator<<(std::ostream &os, composite_value const &v) {
    return os << v.render();
}

} // namespace pgtext
} // namespace qb
