/**
 * @file geometric.h
 * @brief PostgreSQL geometric values: point and box
 *
 * Text values of `point` and `box` columns are recovered into these types when
 * a composite value is materialized, since callers only see them as plain
 * strings. Parsing is fallible and reports failure through std::optional.
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

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace qb {
namespace pgtext {

/**
 * @brief Geometric point, matches PostgreSQL `point` type
 */
struct point {
    double x = 0;
    double y = 0;

    bool
    operator==(point const &rhs) const {
        return x == rhs.x && y == rhs.y;
    }
    bool
    operator!=(point const &rhs) const {
        return !(*this == rhs);
    }
};

/**
 * @brief Rectangular box given by two opposite corners, matches PostgreSQL `box`
 */
struct box {
    point first;
    point second;

    bool
    operator==(box const &rhs) const {
        return first == rhs.first && second == rhs.second;
    }
    bool
    operator!=(box const &rhs) const {
        return !(*this == rhs);
    }
};

/**
 * @brief Parse the text form of a point, `(x,y)` or `x,y`
 * @return The point, or std::nullopt when the text is not a point
 */
std::optional<point> parse_point(std::string_view text);

/**
 * @brief Parse the text form of a box, `(x1,y1),(x2,y2)`
 * @return The box, or std::nullopt when the text is not a box
 */
std::optional<box> parse_box(std::string_view text);

/**
 * @brief Text form of a point, `(x,y)`
 */
std::string to_string(point const &p);

/**
 * @brief Text form of a box, `(x1,y1),(x2,y2)`
 */
std::string to_string(box const &b);

std::ostream &operator<<(std::ostream &os, point const &p);
std::ostream &operator<<(std::ostream &os, box const &b);

} // namespace pgtext
} // namespace qb
