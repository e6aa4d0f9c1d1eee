/**
 * @file text_format.h
 * @brief Text formatting helpers shared by the codec
 *
 * This file provides small helpers to print floating-point numbers in their
 * shortest round-trip form, the way the server prints them, and to trim and
 * compare ASCII text.
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

namespace qb {
namespace pgtext {
namespace util {

/**
 * @brief Shortest text that reads back as the same double
 *
 * Special values are printed as `NaN`, `Infinity` and `-Infinity`.
 */
std::string format_double(double value);

/**
 * @brief Shortest text that reads back as the same float
 */
std::string format_float(float value);

/**
 * @brief Parse a whole string as a double
 *
 * Surrounding whitespace is ignored; any other trailing character makes the
 * parse fail. The parse does not depend on the process locale.
 *
 * @return The value, or std::nullopt when the text is not a number
 */
std::optional<double> parse_double(std::string_view text);

/**
 * @brief Check text against the decimal number grammar
 *
 * Accepts an optional sign, digits with an optional fraction (`1`, `1.`,
 * `.5`, `1.5`) and an optional exponent. Whitespace is not accepted.
 */
bool is_numeric_literal(std::string_view text);

/**
 * @brief Remove leading and trailing ASCII whitespace
 */
std::string_view trim(std::string_view text);

/**
 * @brief ASCII case-insensitive comparison
 */
bool iequals(std::string_view lhs, std::string_view rhs);

} // namespace util
} // namespace pgtext
} // namespace qb
