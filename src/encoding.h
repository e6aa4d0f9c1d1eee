/**
 * @file encoding.h
 * @brief Client encoding support for binary attribute rendering
 *
 * The server reports text in the client encoding of the session. A charset
 * decoder turns `bytea` attribute content into UTF-8 text when a composite
 * value is rendered.
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

#include <optional>
#include <string>

#include "./pg_types.h"

namespace qb {
namespace pgtext {

/**
 * @brief Decodes raw bytes of a given PostgreSQL client encoding
 */
class charset_decoder {
public:
    /**
     * @brief Build a decoder for a PostgreSQL encoding name
     * @param pg_encoding Encoding name as reported by the server (`UTF8`, `LATIN1`, ...)
     * @throws error::client_error if the encoding is not known
     */
    explicit charset_decoder(std::string pg_encoding = "UTF8");

    /**
     * @brief PostgreSQL name of the encoding
     */
    std::string const &
    name() const {
        return _pg_encoding;
    }

    /**
     * @brief Charset name used for the conversion to UTF-8
     */
    std::string const &
    charset() const {
        return _charset;
    }

    /**
     * @brief Decode bytes to UTF-8 text
     *
     * Bytes that cannot be converted are returned unchanged.
     */
    std::string decode(bytea const &data) const;

    /**
     * @brief Map a PostgreSQL encoding name to an iconv charset name
     * @return The charset, or std::nullopt for an unknown encoding
     */
    static std::optional<std::string> iconv_charset_name(std::string const &pg_encoding);

private:
    std::string _pg_encoding;
    std::string _charset;
};

} // namespace pgtext
} // namespace qb
