//
// Error.hh
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

#include <concepts>
#include <exception>
#include <source_location>
#include <stdexcept>
#include <typeinfo>

namespace pubip {

    /// Integer type of error codes.
    using errorcode_t = int32_t;

    /// Maps an error code of some domain to a human-readable description.
    using ErrorDescriptionFunc = string (*)(errorcode_t);


    /// Specialize this for every enum used as an error domain. Members:
    /// - `name`: a `string_view` naming the domain, e.g. "DNS";
    /// - `description`: an `ErrorDescriptionFunc`;
    /// - `strategy` (optional): `true` for the transport/protocol errors a lookup strategy
    ///   reports (sockets, TLS, DNS, HTTP).
    template <typename ERR> struct ErrorDomainInfo { };


    /// An `enum class` over `errorcode_t`, with an `ErrorDomainInfo` specialization.
    /// Code 0 is reserved for "no error".
    template <typename T>
    concept ErrorDomain = std::is_enum_v<T>
        && std::same_as<std::underlying_type_t<T>, errorcode_t>
        && requires {
            {ErrorDomainInfo<T>::name} -> std::convertible_to<string_view>;
            {ErrorDomainInfo<T>::description} -> std::convertible_to<ErrorDescriptionFunc>;
        };



    /** A type-erased error code: a code number plus the ErrorDomain enum it belongs to.
        The default value means "no error". */
    class Error {
    public:
        constexpr Error() = default;

        template <ErrorDomain D>
        Error(D d)                          :_code(errorcode_t(d)), _domain(errorcode_t(d) ? meta<D>() : nullptr) { }

        /// The message is for the reader of the calling code; it isn't stored.
        template <ErrorDomain D>
        Error(D d, string_view)             :Error(d) { }

        /// Converts a caught exception: an `Exception` gives back its Error, anything else
        /// maps to a `CppError`.
        explicit Error(std::exception const&);
        explicit Error(std::exception_ptr);

        errorcode_t code() const            {return _code;}

        /// The domain's name, or "" for no error.
        string_view domain() const          {return _domain ? _domain->name : string_view{};}

        /// True if the domain is marked as a lookup strategy's.
        bool isStrategy() const             {return _domain && _domain->strategy;}

        /// The domain's description of the code, or `brief()` if it has none.
        string description() const;

        /// "<domain> error <code>", or "(no error)".
        string brief() const;

        friend std::ostream& operator<< (std::ostream&, Error const&);

        explicit operator bool() const      {return _code != 0;}

        template <ErrorDomain D>
        bool is() const                     {return _domain == meta<D>();}

        /// The code as a `D`, or `D{0}` if the error is from another domain.
        template <ErrorDomain D>
        D as() const                        {return is<D>() ? D{_code} : D{0};}

        friend bool operator== (Error const&, Error const&) = default;

        friend bool operator== (Error const& err, ErrorDomain auto d) {
            return err == Error(d);
        }

        /// Logs and throws this error as an `Exception`. Must not be called on `noerror`.
        [[noreturn]] void raise(string_view logMessage = "",
                                std::source_location const& = std::source_location::current()) const;

        void raise_if(string_view logMessage = "",
                      std::source_location const& loc = std::source_location::current()) const {
            if (*this) raise(logMessage, loc);
        }

        template <ErrorDomain D>
        [[noreturn]] static void raise(D d, string_view msg = "",
                                       std::source_location const& loc = std::source_location::current()) {
            Error(d).raise(msg, loc);
        }

    private:
        struct DomainMeta {
            string_view          name;
            ErrorDescriptionFunc description;
            bool                 strategy;
        };

        // One instance per domain enum, so domains compare by address.
        template <ErrorDomain D>
        static DomainMeta const* meta() {
            static constexpr DomainMeta sMeta {
                ErrorDomainInfo<D>::name,
                ErrorDomainInfo<D>::description,
                [] {
                    if constexpr (requires {{ErrorDomainInfo<D>::strategy} -> std::convertible_to<bool>;})
                        return bool(ErrorDomainInfo<D>::strategy);
                    else
                        return false;
                }()
            };
            return &sMeta;
        }

        errorcode_t         _code = 0;
        DomainMeta const*   _domain = nullptr;
    };


    constexpr Error noerror {};


    /** A C++ exception carrying an Error. */
    class Exception : public std::runtime_error, public Error {
    public:
        explicit Exception(Error err)   :runtime_error(err.description()), Error(err) { }
        Error error() const             {return *this;}
    };



    /// Errors internal to PubIP's runtime.
    enum class PubIPError : errorcode_t {
        Cancelled = 1,              // an operation was aborted by closing its socket
        EmptyResult,                // the value of an empty Result was requested
        InvalidState,               // an object was used in a state that doesn't allow it
        InvalidURL,                 // a URL couldn't be parsed
        LogicError,                 // a bug
        ParseError,                 // malformed input data
        Timeout,                    // an operation took too long
    };

    template <> struct ErrorDomainInfo<PubIPError> {
        static constexpr string_view name = "PubIP";
        static string description(errorcode_t);
    };


    /// Standard C++ exception types, for errors converted from caught exceptions.
    enum class CppError : errorcode_t {
        exception = 1,
        logic_error,
        invalid_argument,
        out_of_range,
        length_error,
        runtime_error,
        range_error,
        overflow_error,
        regex_error,
        system_error,
        bad_cast,
        bad_optional_access,
        bad_variant_access,
        bad_function_call,
        bad_alloc,
    };

    template <> struct ErrorDomainInfo<CppError> {
        static constexpr string_view name = "exception";
        static string description(errorcode_t);
    };

}
