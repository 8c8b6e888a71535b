//
// Resolution.hh
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
#include "Address.hh"
#include "Error.hh"
#include "Result.hh"

#include <memory>

namespace pubip {

    /// Errors produced by the resolution pipeline itself, independent of any strategy.
    enum class ResolveError : errorcode_t {
        NoAddress = 1,          // A strategy's answer was empty, or wasn't a valid IP address
        VersionMismatch,        // A strategy returned an address of the wrong family
    };

    template <> struct ErrorDomainInfo<ResolveError> {
        static constexpr string_view name = "Resolve";
        static string description(errorcode_t);
    };


    /// Coarse classification of an Error flowing through a resolution sequence.
    enum class ErrorKind : uint8_t {
        None,               // not an error
        NoAddress,          // ResolveError::NoAddress
        VersionMismatch,    // ResolveError::VersionMismatch
        Strategy,           // transport/protocol failure inside a DNS or HTTP strategy
        Other,              // anything else, e.g. an unexpected exception
    };

    ErrorKind KindOf(Error const&);

    string_view KindName(ErrorKind);


    /// Tags the strategy that produced a Details object.
    enum class DetailsKind : uint8_t {
        DNS,
        HTTP,
        Custom,
    };


    /** Abstract evidence of how an address was obtained. Each strategy has its own subclass,
        which declares a `static constexpr DetailsKind Kind`. */
    class Details {
    public:
        virtual ~Details() = default;

        virtual DetailsKind kind() const =0;

        /// Human-readable summary, for logging.
        virtual string description() const =0;

        /// Returns this as a `D`, or nullptr if it isn't one.
        template <class D>
        D const* as() const {
            if constexpr (D::Kind == DetailsKind::Custom)
                return dynamic_cast<D const*>(this);
            else
                return kind() == D::Kind ? static_cast<D const*>(this) : nullptr;
        }
    };


    /** A successfully obtained address, plus the details of how it was obtained. */
    struct Resolution {
        IPAddress                   address;
        std::unique_ptr<Details>    details;
    };

}
