//
// Resolution.cc
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

#include "Resolution.hh"
#include "Internal.hh"

namespace pubip {
    using namespace std;


    string ErrorDomainInfo<ResolveError>::description(errorcode_t code) {
        using enum ResolveError;
        static constexpr NameEntry names[] = {
            {errorcode_t(NoAddress), "no valid IP address in the answer"},
            {errorcode_t(VersionMismatch), "address is of the wrong IP version"},
        };
        return NameEntry::lookup(code, names);
    }


    ErrorKind KindOf(Error const& err) {
        if (!err)
            return ErrorKind::None;
        else if (err == ResolveError::NoAddress)
            return ErrorKind::NoAddress;
        else if (err == ResolveError::VersionMismatch)
            return ErrorKind::VersionMismatch;
        else if (err.isStrategy())
            return ErrorKind::Strategy;
        else
            return ErrorKind::Other;
    }


    string_view KindName(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::None:               return "none";
            case ErrorKind::NoAddress:          return "no address";
            case ErrorKind::VersionMismatch:    return "version mismatch";
            case ErrorKind::Strategy:           return "strategy";
            case ErrorKind::Other:              return "other";
        }
        return "?";
    }

}
