/**
 * @file temporal.cpp
 * @brief Implementation of date/time values and the default temporal parser
 *
 * Parsing follows the ISO output style of the server, e.g.
 * `2024-03-01 12:30:45.123456+02` or `0044-03-15 BC`. Calendar arithmetic
 * uses the proleptic Gregorian calendar.
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

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <regex>

#include "./error.h"
#include "./temporal.h"
#include "./util/text_format.h"

namespace qb {
namespace pgtext {

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 86400;
constexpr std::int64_t USECS_PER_SEC   = 1000000;
constexpr std::int64_t USECS_PER_DAY   = SECONDS_PER_DAY * USECS_PER_SEC;

/**
 * @brief Days since 1970-01-01 of a proleptic Gregorian date
 */
std::int64_t
days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    std::int64_t const era = (y >= 0 ? y : y - 399) / 400;
    auto const         yoe = static_cast<unsigned>(y - era * 400);
    unsigned const     doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    unsigned const     doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

/**
 * @brief Proleptic Gregorian date of a day count since 1970-01-01
 */
date
civil_from_days(std::int64_t z) {
    z += 719468;
    std::int64_t const era = (z >= 0 ? z : z - 146096) / 146097;
    auto const         doe = static_cast<unsigned>(z - era * 146097);
    unsigned const     yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    std::int64_t const y   = static_cast<std::int64_t>(yoe) + era * 400;
    unsigned const     doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    unsigned const     mp  = (5 * doy + 2) / 153;
    unsigned const     d   = doy - (153 * mp + 2) / 5 + 1;
    unsigned const     m   = mp < 10 ? mp + 3 : mp - 9;
    return date{static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
}

std::int64_t
floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
        --q;
    return q;
}

int
to_int(std::ssub_match const &m) {
    return std::atoi(m.str().c_str());
}

/**
 * @brief Fractional seconds digits to microseconds, extra digits are dropped
 */
int
to_microseconds(std::ssub_match const &m) {
    if (!m.matched)
        return 0;
    std::string digits = m.str().substr(0, 6);
    digits.append(6 - digits.size(), '0');
    return std::atoi(digits.c_str());
}

std::optional<int>
to_offset(std::ssub_match const &sign, std::ssub_match const &hours,
          std::ssub_match const &minutes, std::ssub_match const &seconds) {
    if (!sign.matched)
        return std::nullopt;
    int offset = to_int(hours) * 3600;
    if (minutes.matched)
        offset += to_int(minutes) * 60;
    if (seconds.matched)
        offset += to_int(seconds);
    return sign.str() == "-" ? -offset : offset;
}

[[noreturn]] void
bad_value(char const *type_name, std::string const &text) {
    throw error::conversion_error(std::string("Bad value for type ") + type_name +
                                  " : " + text);
}

bool
valid_time(time_of_day const &t) {
    return t.hour >= 0 && t.hour <= 24 && t.minute >= 0 && t.minute <= 59 &&
           t.second >= 0 && t.second <= 60;
}

bool
valid_date(date const &d) {
    return d.month >= 1 && d.month <= 12 && d.day >= 1 && d.day <= 31;
}

/**
 * @brief Parse a date with an optional time part
 */
timestamp
parse_timestamp(char const *type_name, std::string const &text) {
    auto const trimmed = util::trim(text);
    if (trimmed == "infinity")
        return timestamp::infinity();
    if (trimmed == "-infinity")
        return timestamp::minus_infinity();

    static const std::regex timestamp_regex(
        R"(\s*(\d{1,7})-(\d{1,2})-(\d{1,2})(?:[ T](\d{1,2}):(\d{1,2})(?::(\d{1,2})(?:\.(\d+))?)?)?\s*(?:([+-])(\d{1,2})(?::?(\d{2}))?(?::?(\d{2}))?)?\s*(BC)?\s*)");

    std::smatch matches;
    if (!std::regex_match(text, matches, timestamp_regex))
        bad_value(type_name, text);

    timestamp result;
    result.day.year  = to_int(matches[1]);
    result.day.month = to_int(matches[2]);
    result.day.day   = to_int(matches[3]);
    if (matches[12].matched)
        result.day.year = 1 - result.day.year;

    if (matches[4].matched) {
        result.time.hour        = to_int(matches[4]);
        result.time.minute      = to_int(matches[5]);
        result.time.second      = matches[6].matched ? to_int(matches[6]) : 0;
        result.time.microsecond = to_microseconds(matches[7]);
    }
    result.time.utc_offset = to_offset(matches[8], matches[9], matches[10], matches[11]);

    if (!valid_date(result.day) || !valid_time(result.time))
        bad_value(type_name, text);
    return result;
}

/**
 * @brief Move a zoned timestamp to the offset of the calendar
 */
void
apply_calendar(std::optional<calendar> const &cal, timestamp &ts) {
    if (!cal || !ts.time.utc_offset || ts.special != timestamp::special_value::none)
        return;

    std::int64_t const local =
        ts.epoch_microseconds() + static_cast<std::int64_t>(cal->utc_offset) * USECS_PER_SEC;
    std::int64_t const days = floor_div(local, USECS_PER_DAY);
    std::int64_t       rest = local - days * USECS_PER_DAY;

    ts.day                = civil_from_days(days);
    ts.time.hour          = static_cast<int>(rest / (3600 * USECS_PER_SEC));
    rest                 %= 3600 * USECS_PER_SEC;
    ts.time.minute        = static_cast<int>(rest / (60 * USECS_PER_SEC));
    rest                 %= 60 * USECS_PER_SEC;
    ts.time.second        = static_cast<int>(rest / USECS_PER_SEC);
    ts.time.microsecond   = static_cast<int>(rest % USECS_PER_SEC);
    ts.time.utc_offset    = cal->utc_offset;
}

void
append_year(std::string &out, int year) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d", year <= 0 ? 1 - year : year);
    out += buffer;
}

void
append_offset(std::string &out, int offset) {
    char buffer[16];
    int  const abs_offset = offset < 0 ? -offset : offset;
    std::snprintf(buffer, sizeof(buffer), "%c%02d", offset < 0 ? '-' : '+',
                  abs_offset / 3600);
    out += buffer;
    if (abs_offset % 3600 != 0) {
        std::snprintf(buffer, sizeof(buffer), ":%02d", (abs_offset % 3600) / 60);
        out += buffer;
    }
    if (abs_offset % 60 != 0) {
        std::snprintf(buffer, sizeof(buffer), ":%02d", abs_offset % 60);
        out += buffer;
    }
}

void
append_month_day(std::string &out, date const &d) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "-%02d-%02d", d.month, d.day);
    out += buffer;
}

} // namespace

bool
date::operator==(date const &rhs) const {
    return year == rhs.year && month == rhs.month && day == rhs.day;
}

bool
date::operator!=(date const &rhs) const {
    return !(*this == rhs);
}

bool
time_of_day::operator==(time_of_day const &rhs) const {
    return hour == rhs.hour && minute == rhs.minute && second == rhs.second &&
           microsecond == rhs.microsecond && utc_offset == rhs.utc_offset;
}

bool
time_of_day::operator!=(time_of_day const &rhs) const {
    return !(*this == rhs);
}

timestamp
timestamp::infinity() {
    timestamp ts;
    ts.special = special_value::infinity;
    return ts;
}

timestamp
timestamp::minus_infinity() {
    timestamp ts;
    ts.special = special_value::minus_infinity;
    return ts;
}

std::int64_t
timestamp::epoch_microseconds() const {
    std::int64_t const days = days_from_civil(day.year, static_cast<unsigned>(day.month),
                                              static_cast<unsigned>(day.day));
    std::int64_t seconds = days * SECONDS_PER_DAY + time.hour * 3600 + time.minute * 60 +
                           time.second - time.utc_offset.value_or(0);
    return seconds * USECS_PER_SEC + time.microsecond;
}

bool
timestamp::operator==(timestamp const &rhs) const {
    if (special != rhs.special)
        return false;
    if (special != special_value::none)
        return true;
    return day == rhs.day && time == rhs.time;
}

bool
timestamp::operator!=(timestamp const &rhs) const {
    return !(*this == rhs);
}

std::optional<calendar>
parse_calendar(std::string const &zone) {
    auto const trimmed = util::trim(zone);
    if (util::iequals(trimmed, "UTC") || util::iequals(trimmed, "GMT") || trimmed == "Z")
        return calendar{0};

    static const std::regex zone_regex(R"(([+-])(\d{1,2})(?::?(\d{2}))?(?::?(\d{2}))?)");
    std::string const       text(trimmed);
    std::smatch             matches;
    if (!std::regex_match(text, matches, zone_regex))
        return std::nullopt;
    return calendar{*to_offset(matches[1], matches[2], matches[3], matches[4])};
}

std::string
to_string(date const &d) {
    std::string out;
    append_year(out, d.year);
    append_month_day(out, d);
    if (d.year <= 0)
        out += " BC";
    return out;
}

std::string
to_string(time_of_day const &t) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d", t.hour, t.minute, t.second);
    std::string out(buffer);
    if (t.microsecond != 0) {
        std::snprintf(buffer, sizeof(buffer), ".%06d", t.microsecond);
        std::string fraction(buffer);
        while (fraction.back() == '0')
            fraction.pop_back();
        out += fraction;
    }
    if (t.utc_offset)
        append_offset(out, *t.utc_offset);
    return out;
}

std::string
to_string(timestamp const &ts) {
    switch (ts.special) {
    case timestamp::special_value::infinity:
        return "infinity";
    case timestamp::special_value::minus_infinity:
        return "-infinity";
    case timestamp::special_value::none:
        break;
    }
    std::string out;
    append_year(out, ts.day.year);
    append_month_day(out, ts.day);
    out += ' ';
    out += to_string(ts.time);
    if (ts.day.year <= 0)
        out += " BC";
    return out;
}

std::ostream &
operator<<(std::ostream &os, date const &d) {
    return os << to_string(d);
}

std::ostream &
operator<<(std::ostream &os, time_of_day const &t) {
    return os << to_string(t);
}

std::ostream &
operator<<(std::ostream &os, timestamp const &ts) {
    return os << to_string(ts);
}

date
timestamp_utils::to_date(std::optional<calendar> const &cal,
                         std::string const             &text) const {
    timestamp ts = parse_timestamp("date", text);
    if (ts.special != timestamp::special_value::none)
        bad_value("date", text);
    apply_calendar(cal, ts);
    return ts.day;
}

time_of_day
timestamp_utils::to_time(std::optional<calendar> const &cal,
                         std::string const             &text) const {
    static const std::regex time_regex(
        R"(\s*(\d{1,2}):(\d{1,2})(?::(\d{1,2})(?:\.(\d+))?)?\s*(?:([+-])(\d{1,2})(?::?(\d{2}))?(?::?(\d{2}))?)?\s*)");

    std::smatch matches;
    if (!std::regex_match(text, matches, time_regex))
        bad_value("time", text);

    time_of_day result;
    result.hour        = to_int(matches[1]);
    result.minute      = to_int(matches[2]);
    result.second      = matches[3].matched ? to_int(matches[3]) : 0;
    result.microsecond = to_microseconds(matches[4]);
    result.utc_offset  = to_offset(matches[5], matches[6], matches[7], matches[8]);
    if (!valid_time(result))
        bad_value("time", text);

    if (cal && result.utc_offset) {
        std::int64_t seconds = result.hour * 3600 + result.minute * 60 + result.second -
                               *result.utc_offset + cal->utc_offset;
        seconds           = seconds - floor_div(seconds, SECONDS_PER_DAY) * SECONDS_PER_DAY;
        result.hour       = static_cast<int>(seconds / 3600);
        result.minute     = static_cast<int>((seconds % 3600) / 60);
        result.second     = static_cast<int>(seconds % 60);
        result.utc_offset = cal->utc_offset;
    }
    return result;
}

timestamp
timestamp_utils::to_timestamp(std::optional<calendar> const &cal,
                              std::string const             &text) const {
    timestamp ts = parse_timestamp("timestamp", text);
    apply_calendar(cal, ts);
    return ts;
}

} // namespace pgtext
} // namespace qb
