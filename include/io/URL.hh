//
// URL.hh
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

#pragma once
#include "util/Base.hh"

#include <optional>

namespace pubip::io {

    /** A parsed absolute URL of the form `scheme://host[:port][/path][?query][#fragment]`.
        The host may be a bracketed IPv6 literal; the brackets are not part of `hostname`.
        Nothing is unescaped, and the fragment is discarded. */
    class URL {
    public:
        /// Parses a URL. Throws `PubIPError::InvalidURL` if it's not valid.
        explicit URL(string_view str);

        /// Parses a URL, returning nullopt if it's not valid.
        static std::optional<URL> tryParse(string_view str);

        string      scheme;
        string      hostname;
        uint16_t    port = 0;       ///< 0 if not given explicitly
        string      path;           ///< Always starts with '/'
        string      query;          ///< Without the '?'

        /// Lowercased version of `scheme`
        string normalizedScheme() const;

        /// The explicit port, else the scheme's default (80 for http, 443 for https), else 0.
        uint16_t effectivePort() const;

        /// The path plus the query, if any: the request-target of an HTTP request.
        string pathAndQuery() const;

        /// Recombines the parts back into a URL.
        string reencoded() const;

    private:
        URL() = default;
        [[nodiscard]] bool _parse(string_view);
    };

}
