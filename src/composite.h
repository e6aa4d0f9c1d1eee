/**
 * @file composite.h
 * @brief Composite (row) values and their type descriptors
 *
 * A composite value is an instance of a PostgreSQL composite type: an
 * ordered list of attributes described by a struct_descriptor. It is built
 * from raw attribute values, which are re-typed according to the declared
 * type of each attribute, and can render itself back to the literal text
 * accepted by the server.
 *
 * @code
 * qb::pgtext::descriptor_cache cache;
 * auto desc = cache.resolve("inventory_item", {{"name", qb::pgtext::oid::text},
 *                                              {"supplier_id", qb::pgtext::oid::int4},
 *                                              {"price", qb::pgtext::oid::numeric}});
 *
 * auto item = qb::pgtext::composite_value::parse(desc, "(\"fuzzy dice\",42,1.99)",
 *                                                qb::pgtext::session_context::default_session());
 * item.render(); // ("fuzzy dice",42,1.99)
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

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "./common.h"
#include "./pg_types.h"
#include "./session.h"
#include "./value.h"

namespace qb {
namespace pgtext {

/**
 * @brief Description of one attribute of a composite type
 */
struct field_descriptor {
    /**
     * @brief The attribute name
     */
    std::string name;

    /**
     * @brief The declared type name, as found in pg_type
     *
     * Used as key by composite_value::attributes_as().
     */
    std::string type_name;

    /**
     * @brief The object ID of the attribute data type
     */
    oid type_oid;
};

using field_list = std::vector<field_descriptor>;

/**
 * @brief Immutable description of a composite type
 *
 * Shared between all composite values of the type through a
 * struct_descriptor_ptr.
 */
class struct_descriptor {
public:
    struct_descriptor(std::string sql_type_name, field_list fields);

    std::string const &
    sql_type_name() const {
        return _sql_type_name;
    }

    field_list const &
    fields() const {
        return _fields;
    }

    std::size_t
    size() const {
        return _fields.size();
    }

    bool
    empty() const {
        return _fields.empty();
    }

    field_descriptor const &
    operator[](std::size_t index) const {
        return _fields[index];
    }

    /**
     * @brief Bounds-checked attribute access
     * @throws error::client_error if the index is out of range
     */
    field_descriptor const &at(std::size_t index) const;

    /**
     * @brief Position of an attribute by name
     */
    std::optional<std::size_t> index_of(std::string const &name) const;

private:
    std::string _sql_type_name;
    field_list  _fields;
};

/**
 * @brief Registry handing out one shared descriptor per composite type name
 *
 * Not synchronised, one cache per session.
 */
class descriptor_cache {
public:
    using attribute_list = std::vector<std::pair<std::string, oid>>;

    explicit descriptor_cache(
        std::shared_ptr<const type_catalog> catalog = std::make_shared<builtin_type_catalog>());

    /**
     * @brief Cached descriptor of a type, nullptr if none
     */
    struct_descriptor_ptr find(std::string const &sql_type_name) const;

    /**
     * @brief Register a descriptor
     * @return The cached descriptor, the existing one if the type is already known
     */
    struct_descriptor_ptr insert(std::string sql_type_name, field_list fields);

    /**
     * @brief Get or build the descriptor of a type from attribute names and OIDs
     *
     * Type names are looked up in the type catalog.
     *
     * @throws error::client_error if the catalog does not know an attribute type
     */
    struct_descriptor_ptr resolve(std::string const    &sql_type_name,
                                  attribute_list const &attributes);

    std::size_t
    size() const {
        return _descriptors.size();
    }

private:
    std::shared_ptr<const type_catalog>          _catalog;
    std::map<std::string, struct_descriptor_ptr> _descriptors;
};

/**
 * @brief Value of a composite type
 */
class composite_value {
public:
    /**
     * @brief Build a composite value from raw attribute values
     *
     * Takes ownership of `raw`. For each attribute in declaration order:
     * - null stays null
     * - `date`, `time`, `timetz`, `timestamp` and `timestamptz` attributes are
     *   parsed with the session temporal parser and default calendar; text the
     *   parser rejects is kept as is
     * - every other attribute goes through coerce()
     *
     * @param descriptor Type of the composite
     * @param raw Attribute values, one per descriptor field
     * @param session Session state, the default session if null
     * @throws error::client_error if the descriptor is null or the number of
     * values does not match the number of fields
     */
    static composite_value materialize(struct_descriptor_ptr descriptor,
                                       std::vector<value> &&raw, session_ptr session);

    /**
     * @brief Build a composite value from its literal text
     *
     * Missing trailing fields are read as null and surplus fields are ignored.
     */
    static composite_value parse(struct_descriptor_ptr descriptor, std::string_view text,
                                 session_ptr session);

    std::string const &
    sql_type_name() const {
        return _descriptor->sql_type_name();
    }

    struct_descriptor_ptr const &
    descriptor() const {
        return _descriptor;
    }

    std::vector<value> const &
    attributes() const {
        return _attributes;
    }

    std::size_t
    size() const {
        return _attributes.size();
    }

    value const &
    operator[](std::size_t index) const {
        return _attributes[index];
    }

    /**
     * @brief Attribute value by name
     * @throws error::client_error if the type has no such attribute
     */
    value const &attribute(std::string const &name) const;

    /**
     * @brief Attributes converted to caller requested representations
     *
     * Attributes whose declared type name is in `map`, that are not null and
     * not already of the requested kind are converted from their text form.
     * Other attributes are returned as is.
     *
     * @throws error::unsupported_conversion for a kind other than integer,
     * bigint, double_precision, decimal, string, boolean or timestamp
     * @throws error::conversion_error if an attribute text is not valid for the kind
     */
    std::vector<value> attributes_as(type_map const &map) const;

    /**
     * @brief Literal text of the composite, `(a,b,...)`
     */
    std::string render() const;

    std::size_t hash() const;

    bool operator==(composite_value const &rhs) const;
    bool
    operator!=(composite_value const &rhs) const {
        return !(*this == rhs);
    }

private:
    composite_value(struct_descriptor_ptr descriptor, std::vector<value> &&attributes,
                    session_ptr session);

    value attribute_as(value const &attribute, target_kind kind) const;

    struct_descriptor_ptr _descriptor;
    std::vector<value>    _attributes;
    session_ptr           _session;
};

std::ostream &operator<<(std::ostream &os, composite_value const &v);

} // namespace pgtext
} // namespace qb

namespace std {

template <>
struct hash<qb::pgtext::composite_value> {
    std::size_t
    operator()(qb::pgtext::composite_value const &v) const {
        return v.hash();
    }
};

} // namespace std
