/**
 * @file encoding.cpp
 * @brief Implementation of the charset decoder
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

#include <algorithm>
#include <cctype>
#include <map>

#include <boost/locale/encoding.hpp>
#include <qb/io.h>

#include "./encoding.h"
#include "./error.h"

namespace qb {
namespace pgtext {

namespace {

const std::map<std::string, std::string> PG_TO_ICONV{
    {"UTF8", "UTF-8"},
    {"UNICODE", "UTF-8"},
    {"SQL_ASCII", "US-ASCII"},
    {"BIG5", "BIG5"},
    {"EUC_CN", "EUC-CN"},
    {"EUC_JP", "EUC-JP"},
    {"EUC_JIS_2004", "EUC-JISX0213"},
    {"EUC_KR", "EUC-KR"},
    {"EUC_TW", "EUC-TW"},
    {"GB18030", "GB18030"},
    {"GBK", "GBK"},
    {"JOHAB", "JOHAB"},
    {"KOI8R", "KOI8-R"},
    {"KOI8U", "KOI8-U"},
    {"LATIN1", "ISO-8859-1"},
    {"LATIN2", "ISO-8859-2"},
    {"LATIN3", "ISO-8859-3"},
    {"LATIN4", "ISO-8859-4"},
    {"LATIN5", "ISO-8859-9"},
    {"LATIN6", "ISO-8859-10"},
    {"LATIN7", "ISO-8859-13"},
    {"LATIN8", "ISO-8859-14"},
    {"LATIN9", "ISO-8859-15"},
    {"LATIN10", "ISO-8859-16"},
    {"ISO_8859_5", "ISO-8859-5"},
    {"ISO_8859_6", "ISO-8859-6"},
    {"ISO_8859_7", "ISO-8859-7"},
    {"ISO_8859_8", "ISO-8859-8"},
    {"SJIS", "SHIFT_JIS"},
    {"SHIFT_JIS_2004", "SHIFT_JISX0213"},
    {"UHC", "CP949"},
    {"WIN866", "CP866"},
    {"WIN874", "CP874"},
    {"WIN1250", "CP1250"},
    {"WIN1251", "CP1251"},
    {"WIN1252", "CP1252"},
    {"WIN1253", "CP1253"},
    {"WIN1254", "CP1254"},
    {"WIN1255", "CP1255"},
    {"WIN1256", "CP1256"},
    {"WIN1257", "CP1257"},
    {"WIN1258", "CP1258"}};

/**
 * @brief Server encoding names are case-insensitive
 */
std::string
normalize(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return name;
}

} // namespace

charset_decoder::charset_decoder(std::string pg_encoding)
    : _pg_encoding(normalize(std::move(pg_encoding))) {
    auto charset = iconv_charset_name(_pg_encoding);
    if (!charset)
        throw error::client_error("Unknown client encoding " + _pg_encoding);
    _charset = *charset;
}

std::optional<std::string>
charset_decoder::iconv_charset_name(std::string const &pg_encoding) {
    auto f = PG_TO_ICONV.find(normalize(pg_encoding));
    if (f == PG_TO_ICONV.end())
        return std::nullopt;
    return f->second;
}

std::string
charset_decoder::decode(bytea const &data) const {
    if (data.empty())
        return {};
    if (_charset == "UTF-8")
        return std::string(data.begin(), data.end());

    char const *first = data.data();
    char const *last  = first + data.size();
    try {
        return boost::locale::conv::to_utf<char>(first, last, _charset,
                                                 boost::locale::conv::stop);
    } catch (boost::locale::conv::invalid_charset_error const &e) {
        LOG_DEBUG("[pgtext] Charset " << _charset << " unavailable: " << e.what());
    } catch (boost::locale::conv::conversion_error const &e) {
        LOG_DEBUG("[pgtext] Cannot decode " << data.size() << " bytes from "
                                            << _pg_encoding << ": " << e.what());
    }
    return std::string(first, last);
}

} // namespace pgtext
} // namespace qb
