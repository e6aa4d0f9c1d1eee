/**
 * @file session.h
 * @brief Read-only session state shared by composite values
 *
 * A session_context gathers what a composite value needs from its
 * connection: the charset decoder of the client encoding, the temporal parser
 * and the default calendar used to read date/time attributes. It is built once
 * from the client options and shared through a session_ptr.
 *
 * @code
 * qb::pgtext::client_options_type opts{
 *     {qb::pgtext::options::CLIENT_ENCODING, "LATIN1"},
 *     {qb::pgtext::options::TIMEZONE, "+02:00"}};
 * auto session = qb::pgtext::session_context::from_options(opts);
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

#include <memory>
#include <optional>

#include "./common.h"
#include "./encoding.h"
#include "./temporal.h"

namespace qb {
namespace pgtext {

class session_context {
public:
    /**
     * @brief Session with UTF8 encoding, the default temporal parser and no calendar
     */
    session_context();

    session_context(charset_decoder decoder, std::shared_ptr<const temporal_parser> parser,
                    std::optional<calendar> default_calendar);

    /**
     * @brief Build a session from client options
     *
     * An unknown `client_encoding` falls back to UTF8 and an unparsable
     * `timezone` leaves the session without default calendar; both are logged.
     */
    static session_ptr from_options(client_options_type const &opts);

    /**
     * @brief Default session, UTF8 and no calendar
     */
    static session_ptr default_session();

    charset_decoder const &
    decoder() const {
        return _decoder;
    }

    temporal_parser const &
    parser() const {
        return *_parser;
    }

    std::optional<calendar> const &
    default_calendar() const {
        return _default_calendar;
    }

private:
    charset_decoder                        _decoder;
    std::shared_ptr<const temporal_parser> _parser;
    std::optional<calendar>                _default_calendar;
};

} // namespace pgtext
} // namespace qb
