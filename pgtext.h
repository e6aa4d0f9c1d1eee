/**
 * @file pgtext.h
 * @brief PostgreSQL composite and array text codec for the QB Actor Framework
 *
 * This file gathers the text codec used for PostgreSQL row values. It
 * provides:
 *
 * - Scanning of composite `(a,b,...)` and array `{a,b,...}` literals into fields
 * - Coercion of attribute values to the native shape of their declared type
 * - Composite values built from raw attributes, with date/time parsing
 * - Re-typing of attributes to caller requested representations
 * - Rendering of composite values back to the literal accepted by the server
 * - Sequential typed reading of composite literal fields
 *
 * @code
 * using namespace qb::pgtext;
 *
 * descriptor_cache cache;
 * auto desc = cache.resolve("complex", {{"r", oid::float8}, {"i", oid::float8}});
 *
 * std::vector<value> raw{value(1), value(2.5)};
 * auto c = composite_value::materialize(desc, std::move(raw),
 *                                       session_context::default_session());
 * c.render(); // (1,2.5)
 * @endcode
 *
 * @see qb::pgtext::composite_value
 * @see qb::pgtext::scan_literal
 * @see qb::pgtext::coerce
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

#include "./src/common.h"
#include "./src/composite.h"
#include "./src/encoding.h"
#include "./src/error.h"
#include "./src/geometric.h"
#include "./src/literal_scanner.h"
#include "./src/pg_types.h"
#include "./src/record_reader.h"
#include "./src/session.h"
#include "./src/temporal.h"
#include "./src/type_coercion.h"
#include "./src/value.h"
