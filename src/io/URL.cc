//
// URL.cc
//
// Copyright 2023-Present Couchbase, Inc. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

#include "io/URL.hh"
#include "Error.hh"
#include "StringUtils.hh"

#include <charconv>

namespace pubip::io {
    using namespace std;


    URL::URL(string_view str) {
        if (!_parse(str))
            Error::raise(PubIPError::InvalidURL, str);
    }


    optional<URL> URL::tryParse(string_view str) {
        URL url;
        if (!url._parse(str))
            return nullopt;
        return url;
    }


    bool URL::_parse(string_view str) {
        // Scheme:
        auto colon = str.find("://");
        if (colon == string::npos || colon == 0)
            return false;
        string_view schemeStr = str.substr(0, colon);
        for (char c : schemeStr) {
            if (!isAlphanumeric(c) && c != '+' && c != '-' && c != '.')
                return false;
        }
        str.remove_prefix(colon + 3);

        // Host:
        string_view hostStr;
        if (str.starts_with('[')) {
            auto close = str.find(']');
            if (close == string::npos)
                return false;
            hostStr = str.substr(1, close - 1);
            str.remove_prefix(close + 1);
        } else {
            auto end = str.find_first_of(":/?#");
            hostStr = str.substr(0, end);
            str.remove_prefix(hostStr.size());
        }
        if (hostStr.empty())
            return false;
        for (char c : hostStr) {
            if (isSpace(c) || c == '@')
                return false;
        }

        // Port:
        uint16_t portNo = 0;
        if (str.starts_with(':')) {
            str.remove_prefix(1);
            auto end = str.find_first_of("/?#");
            string_view portStr = str.substr(0, end);
            unsigned n = 0;
            auto [ptr, ec] = from_chars(portStr.data(), portStr.data() + portStr.size(), n);
            if (portStr.empty() || ec != errc{} || ptr != portStr.data() + portStr.size()
                    || n == 0 || n > UINT16_MAX)
                return false;
            portNo = uint16_t(n);
            str.remove_prefix(portStr.size());
        }

        // Path, query, fragment:
        string_view pathStr, queryStr;
        if (auto hash = str.find('#'); hash != string::npos)
            str = str.substr(0, hash);
        tie(pathStr, queryStr) = split(str, '?');
        if (!pathStr.empty() && pathStr[0] != '/')
            return false;

        scheme = schemeStr;
        hostname = hostStr;
        port = portNo;
        path = pathStr.empty() ? "/" : string(pathStr);
        query = queryStr;
        return true;
    }


    string URL::normalizedScheme() const {
        return toLower(scheme);
    }


    uint16_t URL::effectivePort() const {
        if (port != 0)
            return port;
        string s = normalizedScheme();
        if (s == "http")
            return 80;
        else if (s == "https")
            return 443;
        else
            return 0;
    }


    string URL::pathAndQuery() const {
        if (query.empty())
            return path;
        return path + "?" + query;
    }


    string URL::reencoded() const {
        string result = scheme + "://";
        if (hostname.find(':') != string::npos)
            result += "[" + hostname + "]";
        else
            result += hostname;
        if (port != 0) {
            result.append(":");
            result += to_string(port);
        }
        result += pathAndQuery();
        return result;
    }

}
