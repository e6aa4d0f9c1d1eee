/**
 * @file temporal.h
 * @brief Date and time values and the calendar-aware temporal parser
 *
 * This file defines the in-memory representation of PostgreSQL `date`,
 * `time`/`timetz` and `timestamp`/`timestamptz` values, together with the
 * temporal_parser interface used when a composite value is materialized, and
 * its default implementation timestamp_utils.
 *
 * Times keep microsecond precision, the precision of the server. A value read
 * from a zoned type keeps its UTC offset; a calendar, when given, moves zoned
 * values to its own offset.
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
#include <iosfwd>
#include <optional>
#include <string>

namespace qb {
namespace pgtext {

/**
 * @brief Calendar date, matches PostgreSQL `date`
 *
 * The year is astronomical: year 0 is 1 BC, year -1 is 2 BC.
 */
struct date {
    int year  = 1970;
    int month = 1;
    int day   = 1;

    bool operator==(date const &rhs) const;
    bool operator!=(date const &rhs) const;
};

/**
 * @brief Time of day, matches PostgreSQL `time` and `timetz`
 */
struct time_of_day {
    int hour        = 0;
    int minute      = 0;
    int second      = 0;
    int microsecond = 0;
    /** Seconds east of UTC, set for values of zoned types */
    std::optional<int> utc_offset;

    bool operator==(time_of_day const &rhs) const;
    bool operator!=(time_of_day const &rhs) const;
};

/**
 * @brief Date and time, matches PostgreSQL `timestamp` and `timestamptz`
 */
struct timestamp {
    enum class special_value { none, infinity, minus_infinity };

    date          day;
    time_of_day   time;
    special_value special = special_value::none;

    static timestamp infinity();
    static timestamp minus_infinity();

    /**
     * @brief Microseconds since 1970-01-01 00:00:00 UTC
     *
     * Values without offset are taken as UTC.
     */
    std::int64_t epoch_microseconds() const;

    bool operator==(timestamp const &rhs) const;
    bool operator!=(timestamp const &rhs) const;
};

/**
 * @brief Time zone context for temporal parsing
 */
struct calendar {
    /** Seconds east of UTC */
    int utc_offset = 0;
};

/**
 * @brief Parse a numeric time zone, `UTC`, `Z`, `+HH`, `-HH:MM`, `+HH:MM:SS`
 * @return The calendar, or std::nullopt when the zone is not understood
 */
std::optional<calendar> parse_calendar(std::string const &zone);

std::string to_string(date const &d);
std::string to_string(time_of_day const &t);
std::string to_string(timestamp const &ts);

std::ostream &operator<<(std::ostream &os, date const &d);
std::ostream &operator<<(std::ostream &os, time_of_day const &t);
std::ostream &operator<<(std::ostream &os, timestamp const &ts);

/**
 * @brief Calendar-aware parser of server date/time text
 *
 * Supplied by the session. Every method throws error::conversion_error when
 * the text cannot be parsed.
 */
class temporal_parser {
public:
    virtual ~temporal_parser() = default;

    virtual date        to_date(std::optional<calendar> const &cal,
                                std::string const             &text) const = 0;
    virtual time_of_day to_time(std::optional<calendar> const &cal,
                                std::string const             &text) const = 0;
    virtual timestamp   to_timestamp(std::optional<calendar> const &cal,
                                     std::string const             &text) const = 0;
};

/**
 * @brief Default parser for the ISO output style of the server
 *
 * Accepts `YYYY-MM-DD`, `HH:MM[:SS[.ffffff]]` and their combination with an
 * optional numeric UTC offset and `BC` suffix, plus `infinity` and
 * `-infinity` timestamps. Fractional digits beyond microseconds are dropped.
 */
class timestamp_utils : public temporal_parser {
public:
    date        to_date(std::optional<calendar> const &cal,
                        std::string const             &text) const override;
    time_of_day to_time(std::optional<calendar> const &cal,
                        std::string const             &text) const override;
    timestamp   to_timestamp(std::optional<calendar> const &cal,
                             std::string const             &text) const override;
};

} // namespace pgtext
} // namespace qb
