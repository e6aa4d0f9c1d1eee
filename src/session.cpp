/**
 * @file session.cpp
 * @brief Implementation of the session context
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

#include <qb/io.h>

#include "./error.h"
#include "./session.h"

namespace qb {
namespace pgtext {

session_context::session_context()
    : _decoder()
    , _parser(std::make_shared<timestamp_utils>())
    , _default_calendar() {}

session_context::session_context(charset_decoder                        decoder,
                                 std::shared_ptr<const temporal_parser> parser,
                                 std::optional<calendar> default_calendar)
    : _decoder(std::move(decoder))
    , _parser(std::move(parser))
    , _default_calendar(default_calendar) {
    if (!_parser)
        throw error::client_error("Session requires a temporal parser");
}

session_ptr
session_context::from_options(client_options_type const &opts) {
    std::string encoding = "UTF8";
    auto        f        = opts.find(options::CLIENT_ENCODING);
    if (f != opts.end()) {
        if (charset_decoder::iconv_charset_name(f->second)) {
            encoding = f->second;
        } else {
            LOG_CRIT("[pgtext] Unknown client encoding " << f->second
                                                         << ", falling back to UTF8");
        }
    }

    std::optional<calendar> default_calendar;
    f = opts.find(options::TIMEZONE);
    if (f != opts.end()) {
        default_calendar = parse_calendar(f->second);
        if (!default_calendar)
            LOG_CRIT("[pgtext] Invalid time zone " << f->second << ", no default calendar");
    }

    charset_decoder decoder(encoding);
    LOG_INFO("[pgtext] Session encoding " << decoder.name() << " (" << decoder.charset()
                                          << "), time zone "
                                          << (f != opts.end() ? f->second : "unset"));
    return std::make_shared<const session_context>(
        std::move(decoder), std::make_shared<timestamp_utils>(), default_calendar);
}

session_ptr
session_context::default_session() {
    static session_ptr const session = std::make_shared<const session_context>();
    return session;
}

} // namespace pgtext
} // namespace qb
