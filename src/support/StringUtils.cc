//
// StringUtils.cc
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

#include "StringUtils.hh"
#include "util/Bytes.hh"

namespace pubip {

    bool equalIgnoringCase(string_view a, string_view b) noexcept {
        size_t len = a.size();
        if (len != b.size())
            return false;
        for (size_t i = 0; i < len; i++) {
            if (toLower(a[i]) != toLower(b[i]))
                return false;
        }
        return true;
    }


    string hexString(ConstBytes bytes) {
        static const char kDigits[17] = "0123456789abcdef";
        std::string result;
        result.reserve(2 * bytes.size());
        for (byte b : bytes) {
            result += kDigits[uint8_t(b) >> 4];
            result += kDigits[uint8_t(b) & 0xF];
        }
        return result;
    }


    std::pair<string_view,string_view>
    split(string_view str, char c) noexcept {
        if (auto p = str.find(c); p != string::npos)
            return {str.substr(0, p), str.substr(p + 1)};
        else
            return {str, ""};
    }


    string_view trim(string_view str) noexcept {
        while (!str.empty() && isSpace(str.front()))
            str.remove_prefix(1);
        while (!str.empty() && isSpace(str.back()))
            str.remove_suffix(1);
        return str;
    }


    bool isValidUTF8(string_view str) noexcept {
        auto s = (const uint8_t*)str.data();
        auto end = s + str.size();
        while (s < end) {
            uint8_t c = *s++;
            if (c < 0x80)
                continue;
            int extra;
            uint32_t cp;
            if ((c & 0xE0) == 0xC0)      {extra = 1; cp = c & 0x1F;}
            else if ((c & 0xF0) == 0xE0) {extra = 2; cp = c & 0x0F;}
            else if ((c & 0xF8) == 0xF0) {extra = 3; cp = c & 0x07;}
            else
                return false;
            if (end - s < extra)
                return false;
            for (int i = 0; i < extra; i++) {
                if ((s[i] & 0xC0) != 0x80)
                    return false;
                cp = (cp << 6) | (s[i] & 0x3F);
            }
            s += extra;
            static constexpr uint32_t kMinForLength[4] = {0, 0x80, 0x800, 0x10000};
            if (cp < kMinForLength[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                return false;
        }
        return true;
    }

}
