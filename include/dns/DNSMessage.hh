//
// DNSMessage.hh
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

#include <optional>
#include <vector>

namespace pubip::dns {

    /// Errors from DNS lookups.
    enum class DNSError : errorcode_t {
        InvalidName = 1,        // The name to look up isn't a valid DNS name
        Truncated,              // The response had the TC (truncated) flag set
        FormatError,            // RCODE 1: the server couldn't interpret the query
        ServerFailure,          // RCODE 2
        NameError,              // RCODE 3: the name does not exist
        NotImplemented,         // RCODE 4
        Refused,                // RCODE 5
        ResponseCode,           // Any other nonzero RCODE
        UnexpectedRecord,       // The first answer isn't of the type that was asked for
        MalformedResponse,      // The response couldn't be parsed
    };


    /// How the public address is extracted from a DNS response.
    enum class QueryMethod : uint8_t {
        A,          ///< The first `A` record is our IPv4 address.
        AAAA,       ///< The first `AAAA` record is our IPv6 address.
        TXT,        ///< The first `TXT` record's first string is our address, in text form.
    };

    string_view QueryMethodName(QueryMethod);


    /// DNS resource-record types used here.
    enum class RecordType : uint16_t {
        A    = 1,
        TXT  = 16,
        AAAA = 28,
        OPT  = 41,
    };

    RecordType RecordTypeFor(QueryMethod);


    /// The UDP payload size advertised in a query's EDNS(0) OPT record.
    static constexpr uint16_t kEDNSPayloadSize = 1232;


    /// True if `name` is a syntactically valid DNS name: dot-separated labels of 1-63
    /// letters, digits, hyphens or underscores, at most 253 characters, with an optional
    /// trailing dot.
    bool IsValidName(string_view name);


    /// Encodes a recursive query for a single question of class IN, with an EDNS(0) OPT
    /// record. Throws `DNSError::InvalidName` if the name is invalid.
    string EncodeQuery(string_view name, RecordType, uint16_t id);


    /// A resource record from a DNS response's answer section.
    struct Answer {
        string      name;
        RecordType  type;
        uint16_t    rrclass = 1;
        uint32_t    ttl = 0;
        string      data;           ///< Raw RDATA
    };


    /// The parts of a DNS response that matter here.
    struct Response {
        uint16_t            id = 0;
        bool                isResponse = false;     ///< QR flag
        bool                truncated = false;      ///< TC flag
        uint8_t             rcode = 0;
        std::vector<Answer> answers;
    };


    /// Parses a DNS response. Throws `DNSError::MalformedResponse` if it's not valid.
    Response DecodeResponse(ConstBytes);

    /// The ID field of a message, without parsing the rest; nullopt if it's too short.
    std::optional<uint16_t> PeekMessageID(ConstBytes);


    /// Extracts the address from a response, according to the query method:
    /// * a truncated response, or nonzero RCODE, is a `DNSError`;
    /// * no answers, or an unparseable TXT string, is `ResolveError::NoAddress`;
    /// * a first answer of the wrong type is `DNSError::UnexpectedRecord`.
    Result<IPAddress> ExtractAddress(Response const&, QueryMethod);

}

namespace pubip {
    template <> struct ErrorDomainInfo<dns::DNSError> {
        static constexpr string_view name = "DNS";
        static constexpr bool strategy = true;
        static string description(errorcode_t);
    };
}
