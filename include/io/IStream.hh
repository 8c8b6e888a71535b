//
// IStream.hh
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
#include "util/Bytes.hh"
#include "Future.hh"

namespace pubip::io {

    /** An asynchronous byte stream, such as a TCP connection or a TLS session over one.
        Only one read and one write may be in progress at a time. */
    class IStream {
    public:
        virtual ~IStream() = default;

        virtual bool isOpen() const =0;

        /// Connects, or performs the handshake.
        virtualASYNC<void> open() =0;

        virtualASYNC<void> close() =0;

        /// Returns the next 1 to `maxLen` bytes, or an empty range at EOF. The bytes live in
        /// the stream's buffer and are only valid until the next read or close.
        virtualASYNC<ConstBytes> readNoCopy(size_t maxLen = 65536) =0;

        /// Writes all the bytes, which must stay valid until the Future resolves.
        virtualASYNC<void> write(ConstBytes) =0;

        /// Writes a string, keeping its own copy while the write is in progress.
        ASYNC<void> write(string);
    };

}
