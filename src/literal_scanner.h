/**
 * @file literal_scanner.h
 * @brief Scanner for PostgreSQL composite and array text literals
 *
 * This file declares the tokenizer that splits the textual representation of a
 * composite value, e.g. `(1,"a,b",)`, or of an array value, e.g. `{1,2,3}`, into
 * its raw field texts. Quoted fields are unescaped; empty fields become NULL
 * tokens.
 *
 * The scanner never throws: malformed or truncated input yields the tokens
 * recognized up to the point where scanning stopped.
 *
 * @see qb::pgtext::composite_value::parse
 * @see qb::pgtext::record_reader
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
#include <string_view>
#include <vector>

namespace qb {
namespace pgtext {

/**
 * @brief Raw text of one field, std::nullopt for NULL
 */
using token = std::optional<std::string>;

/**
 * @brief Ordered raw field texts of a literal
 */
using token_list = std::vector<token>;

/**
 * @brief Split a delimited literal into raw field texts
 *
 * Scans `text` left to right:
 * - `open` marks the start of the field region
 * - `close` finalizes the current field and ends the scan
 * - `,` finalizes the current field
 * - `"` starts a quoted field where `""` is a literal quote and a backslash
 *   escapes the next character
 * - whitespace outside quotes ends the scan; the fields that follow it,
 *   including the one in progress, are dropped
 *
 * A field with nothing between its delimiters is returned as std::nullopt,
 * while a quoted empty string `""` is returned as an empty string.
 *
 * @param text Literal text
 * @param open Opening delimiter, '(' for composites and '{' for arrays
 * @param close Closing delimiter, ')' for composites and '}' for arrays
 * @return The field tokens in order of appearance
 */
token_list scan_literal(std::string_view text, char open, char close);

/**
 * @brief Literal tokenizer bound to a pair of delimiters
 *
 * @tparam Open Opening delimiter
 * @tparam Close Closing delimiter
 */
template <char Open, char Close>
struct literal_tokenizer {
    static constexpr char open_delimiter  = Open;
    static constexpr char close_delimiter = Close;

    static token_list
    tokenize(std::string_view text) {
        return scan_literal(text, Open, Close);
    }
};

/** @brief Tokenizer for composite (row) literals */
using composite_tokenizer = literal_tokenizer<'(', ')'>;
/** @brief Tokenizer for array literals */
using array_tokenizer = literal_tokenizer<'{', '}'>;

/**
 * @brief Split a composite literal `( ... )` into its field tokens
 */
inline token_list
parse_composite_literal(std::string_view text) {
    return composite_tokenizer::tokenize(text);
}

/**
 * @brief Split an array literal `{ ... }` into its element tokens
 */
inline token_list
parse_array_literal(std::string_view text) {
    return array_tokenizer::tokenize(text);
}

} // namespace pgtext
} // namespace qb
