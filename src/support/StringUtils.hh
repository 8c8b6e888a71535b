//
// StringUtils.hh
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

namespace pubip {
    class ConstBytes;


    /// Plain-ASCII version of `tolower`, with no nonsense about locales or ints.
    Pure inline char toLower(char c) noexcept {
        if (c >= 'A' && c <= 'Z')
            c += 32;
        return c;
    }

    /// Plain-ASCII version of `toupper`, with no nonsense about locales or ints.
    Pure inline char toUpper(char c) noexcept {
        if (c >= 'a' && c <= 'z')
            c -= 32;
        return c;
    }

    Pure inline bool isDigit(char c) noexcept {
        return c >= '0' && c <= '9';
    }

    Pure inline bool isAlphanumeric(char c) noexcept {
        return isDigit(c) || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    /// Space, tab, CR or LF.
    Pure inline bool isSpace(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    /// Lowercases a string.
    inline string toLower(string str) {
        for (char &c : str)
            c = toLower(c);
        return str;
    }

    /// Returns a string of hex
    string hexString(ConstBytes bytes);

    /// Case-insensitive equality comparison (ASCII only!)
    Pure bool equalIgnoringCase(string_view a, string_view b) noexcept;

    /// Splits a string around the first occurrence of `c`;
    /// if there is none, assumes it's at the end, i.e. returns `{str, ""}`.
    Pure std::pair<string_view,string_view> split(string_view str, char c) noexcept;

    /// Removes leading and trailing ASCII whitespace.
    Pure string_view trim(string_view str) noexcept;

    /// True if the string is well-formed UTF-8 (no overlongs, surrogates or values > U+10FFFF.)
    Pure bool isValidUTF8(string_view str) noexcept;
}
