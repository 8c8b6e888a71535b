//
// Bytes.hh
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

#include <algorithm>
#include <cstring>
#include <span>

namespace pubip {

    using std::byte;


    /** A read-only byte range: data to write, a datagram, or what `readNoCopy` returns.
        The `read` methods consume bytes from the front. */
    class ConstBytes : public std::span<const byte> {
    public:
        using span::span;

        ConstBytes() = default;
        ConstBytes(std::span<const byte> s)             :span(s) { }
        ConstBytes(string_view str)                     :span((const byte*)str.data(), str.size()) { }
        ConstBytes(string const& str)                   :ConstBytes(string_view(str)) { }
        ConstBytes(const void* begin, size_t n)         :span((const byte*)begin, n) { }

        explicit operator string_view() const noexcept Pure {
            return {(const char*)data(), size()};
        }

        ConstBytes without_first(size_t n) const noexcept Pure {return subspan(n);}

        /// Copies up to `dstSize` bytes into `dst` and consumes them.
        [[nodiscard]] size_t read(void* dst, size_t dstSize) noexcept {
            size_t n = std::min(dstSize, size());
            ::memcpy(dst, data(), n);
            *this = without_first(n);
            return n;
        }

        /// Consumes and returns up to `maxLen` bytes.
        [[nodiscard]] ConstBytes read(size_t maxLen) noexcept {
            ConstBytes head = first(std::min(maxLen, size()));
            *this = without_first(head.size());
            return head;
        }
    };


    /** A socket's input buffer. `readNoCopy` hands out slices of it. */
    struct Buffer {
        static constexpr size_t kCapacity = 65536 - 2 * sizeof(uint32_t);

        uint32_t    size = 0;               // bytes of valid data
        uint32_t    used = 0;               // bytes already handed out
        std::byte   data[kCapacity];

        size_t available() const noexcept Pure  {return size - used;}
        bool empty() const noexcept Pure        {return size == used;}

        ConstBytes read(size_t maxLen) {
            size_t n = std::min(maxLen, available());
            ConstBytes result(data + used, n);
            used += uint32_t(n);
            return result;
        }
    };

    using BufferRef = std::unique_ptr<Buffer>;

}
