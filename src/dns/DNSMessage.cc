//
// DNSMessage.cc
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

#include "dns/DNSMessage.hh"
#include "Resolution.hh"
#include "Internal.hh"
#include "StringUtils.hh"

namespace pubip::dns {
    using namespace std;


    // Header flag bits:
    static constexpr uint16_t kFlagQR = 0x8000;
    static constexpr uint16_t kFlagTC = 0x0200;
    static constexpr uint16_t kFlagRD = 0x0100;
    static constexpr uint16_t kRCodeMask = 0x000F;

    static constexpr uint16_t kClassIN = 1;
    static constexpr size_t   kHeaderSize = 12;
    static constexpr size_t   kMaxNameLength = 253;
    static constexpr size_t   kMaxLabelLength = 63;
    static constexpr int      kMaxPointerHops = 32;


    string_view QueryMethodName(QueryMethod m) {
        switch (m) {
            case QueryMethod::A:    return "A";
            case QueryMethod::AAAA: return "AAAA";
            case QueryMethod::TXT:  return "TXT";
            default:                return "?";
        }
    }


    RecordType RecordTypeFor(QueryMethod m) {
        switch (m) {
            case QueryMethod::A:    return RecordType::A;
            case QueryMethod::AAAA: return RecordType::AAAA;
            default:                return RecordType::TXT;
        }
    }


#pragma mark - ENCODING:


    bool IsValidName(string_view name) {
        if (name.ends_with('.'))
            name.remove_suffix(1);
        if (name.empty() || name.size() > kMaxNameLength || name.ends_with('.'))
            return false;
        while (!name.empty()) {
            auto [label, rest] = split(name, '.');
            if (label.empty() || label.size() > kMaxLabelLength)
                return false;
            for (char c : label) {
                if (!isAlphanumeric(c) && c != '-' && c != '_')
                    return false;
            }
            name = rest;
        }
        return true;
    }


    static void writeUint16(string& out, uint16_t n) {
        out += char(n >> 8);
        out += char(n & 0xFF);
    }


    static void encodeName(string& out, string_view name) {
        if (name.ends_with('.'))
            name.remove_suffix(1);
        while (!name.empty()) {
            auto [label, rest] = split(name, '.');
            out += char(label.size());
            out += label;
            name = rest;
        }
        out += '\0';
    }


    string EncodeQuery(string_view name, RecordType type, uint16_t id) {
        if (!IsValidName(name))
            Error::raise(DNSError::InvalidName, name);
        string msg;
        msg.reserve(kHeaderSize + name.size() + 2 + 4 + 11);
        writeUint16(msg, id);
        writeUint16(msg, kFlagRD);
        writeUint16(msg, 1);            // QDCOUNT
        writeUint16(msg, 0);            // ANCOUNT
        writeUint16(msg, 0);            // NSCOUNT
        writeUint16(msg, 1);            // ARCOUNT: the OPT record

        encodeName(msg, name);
        writeUint16(msg, uint16_t(type));
        writeUint16(msg, kClassIN);

        // EDNS(0) OPT pseudo-record: root name, CLASS is the UDP payload size,
        // TTL holds the extended RCODE, version and flags (all zero), no options.
        msg += '\0';
        writeUint16(msg, uint16_t(RecordType::OPT));
        writeUint16(msg, kEDNSPayloadSize);
        writeUint16(msg, 0);
        writeUint16(msg, 0);
        writeUint16(msg, 0);            // RDLENGTH
        return msg;
    }


#pragma mark - DECODING:


    namespace {
        /** Bounds-checked reader over a DNS message. Any overrun throws MalformedResponse. */
        class Reader {
        public:
            explicit Reader(ConstBytes msg) :_msg(msg) { }

            size_t pos() const              {return _pos;}
            size_t remaining() const        {return _msg.size() - _pos;}

            uint8_t readUint8() {
                need(1);
                return uint8_t(_msg[_pos++]);
            }

            uint16_t readUint16() {
                need(2);
                uint16_t n = uint16_t((uint8_t(_msg[_pos]) << 8) | uint8_t(_msg[_pos + 1]));
                _pos += 2;
                return n;
            }

            uint32_t readUint32() {
                uint32_t hi = readUint16();
                return (hi << 16) | readUint16();
            }

            string readBytes(size_t n) {
                need(n);
                string result((const char*)&_msg[_pos], n);
                _pos += n;
                return result;
            }

            /// Reads a possibly-compressed domain name, advancing past it.
            string readName() {
                string name;
                size_t pos = _pos;
                size_t resumeAt = 0;
                int hops = 0;
                while (true) {
                    if (pos >= _msg.size())
                        fail("name runs past end of message");
                    uint8_t len = uint8_t(_msg[pos]);
                    if ((len & 0xC0) == 0xC0) {
                        // Compression pointer to an earlier offset:
                        if (pos + 1 >= _msg.size())
                            fail("truncated compression pointer");
                        if (++hops > kMaxPointerHops)
                            fail("compression pointer loop");
                        if (resumeAt == 0)
                            resumeAt = pos + 2;
                        pos = ((len & 0x3F) << 8) | uint8_t(_msg[pos + 1]);
                    } else if (len & 0xC0) {
                        fail("invalid label type");
                    } else if (len == 0) {
                        _pos = resumeAt ? resumeAt : pos + 1;
                        return name.empty() ? "." : name;
                    } else {
                        if (pos + 1 + len > _msg.size())
                            fail("label runs past end of message");
                        if (!name.empty())
                            name += '.';
                        name.append((const char*)&_msg[pos + 1], len);
                        if (name.size() > 255)
                            fail("name too long");
                        pos += 1 + len;
                    }
                }
            }

            void skip(size_t n)             {need(n); _pos += n;}

        private:
            void need(size_t n) {
                if (n > remaining())
                    fail("message too short");
            }

            [[noreturn]] static void fail(const char* why) {
                Error::raise(DNSError::MalformedResponse, why);
            }

            ConstBytes  _msg;
            size_t      _pos = 0;
        };
    }


    optional<uint16_t> PeekMessageID(ConstBytes msg) {
        if (msg.size() < 2)
            return nullopt;
        auto bytes = (const uint8_t*)msg.data();
        return uint16_t((bytes[0] << 8) | bytes[1]);
    }


    Response DecodeResponse(ConstBytes msg) {
        Reader in(msg);
        Response response;
        response.id = in.readUint16();
        uint16_t flags = in.readUint16();
        response.isResponse = (flags & kFlagQR) != 0;
        response.truncated = (flags & kFlagTC) != 0;
        response.rcode = uint8_t(flags & kRCodeMask);
        uint16_t qdCount = in.readUint16();
        uint16_t anCount = in.readUint16();
        (void)in.readUint16();          // NSCOUNT
        (void)in.readUint16();          // ARCOUNT

        for (uint16_t i = 0; i < qdCount; ++i) {
            (void)in.readName();
            in.skip(4);                 // QTYPE, QCLASS
        }

        // A truncated response may legitimately stop partway through the answers.
        for (uint16_t i = 0; i < anCount; ++i) {
            if (response.truncated && in.remaining() == 0)
                break;
            Answer answer;
            answer.name = in.readName();
            answer.type = RecordType(in.readUint16());
            answer.rrclass = in.readUint16();
            answer.ttl = in.readUint32();
            uint16_t rdLength = in.readUint16();
            answer.data = in.readBytes(rdLength);
            response.answers.push_back(std::move(answer));
        }
        return response;
    }


    static Error rcodeError(uint8_t rcode) {
        switch (rcode) {
            case 1:  return DNSError::FormatError;
            case 2:  return DNSError::ServerFailure;
            case 3:  return DNSError::NameError;
            case 4:  return DNSError::NotImplemented;
            case 5:  return DNSError::Refused;
            default: return DNSError::ResponseCode;
        }
    }


    Result<IPAddress> ExtractAddress(Response const& response, QueryMethod method) {
        if (response.truncated)
            return DNSError::Truncated;
        if (response.rcode != 0)
            return rcodeError(response.rcode);
        if (response.answers.empty())
            return ResolveError::NoAddress;

        Answer const& answer = response.answers.front();
        if (answer.type != RecordTypeFor(method))
            return DNSError::UnexpectedRecord;

        optional<IPAddress> addr;
        switch (method) {
            case QueryMethod::A:
                if (answer.data.size() != 4)
                    return DNSError::MalformedResponse;
                addr = IPAddress::fromBytes(ConstBytes(answer.data));
                break;
            case QueryMethod::AAAA:
                if (answer.data.size() != 16)
                    return DNSError::MalformedResponse;
                addr = IPAddress::fromBytes(ConstBytes(answer.data));
                break;
            case QueryMethod::TXT: {
                // RDATA is a sequence of <length><chars> strings; the address is the first.
                if (answer.data.empty())
                    return ResolveError::NoAddress;
                size_t len = uint8_t(answer.data[0]);
                if (1 + len > answer.data.size())
                    return DNSError::MalformedResponse;
                string_view text(answer.data.data() + 1, len);
                if (!isValidUTF8(text))
                    return ResolveError::NoAddress;
                addr = IPAddress::parse(trim(text));
                break;
            }
        }
        if (!addr)
            return ResolveError::NoAddress;
        return *addr;
    }

}


namespace pubip {

    string ErrorDomainInfo<dns::DNSError>::description(errorcode_t code) {
        using enum dns::DNSError;
        static constexpr NameEntry names[] = {
            {errorcode_t(InvalidName), "invalid DNS name"},
            {errorcode_t(Truncated), "DNS response was truncated"},
            {errorcode_t(FormatError), "DNS server reported a format error"},
            {errorcode_t(ServerFailure), "DNS server failure"},
            {errorcode_t(NameError), "DNS name does not exist"},
            {errorcode_t(NotImplemented), "DNS server does not implement the query"},
            {errorcode_t(Refused), "DNS server refused the query"},
            {errorcode_t(ResponseCode), "DNS server returned an error code"},
            {errorcode_t(UnexpectedRecord), "DNS answer has an unexpected record type"},
            {errorcode_t(MalformedResponse), "malformed DNS response"},
        };
        return NameEntry::lookup(code, names);
    }

}
