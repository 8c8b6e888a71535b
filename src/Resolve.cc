//
// Resolve.cc
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

#include "Resolve.hh"
#include "util/Logging.hh"

namespace pubip {
    using namespace std;


    Resolutions Resolve(std::vector<ResolverRef> resolvers, Version v) {
        InitLogging();
        Resolutions items = Fallback(std::move(resolvers), v);
        while (true) {
            Result<Resolution> item = AWAIT items;
            if (item.empty())
                break;
            if (item.ok() && !Matches(v, item->address)) {
                LResolve->info("Rejecting {} address {}: wanted {}",
                               VersionName(item->address.version()), item->address.toString(),
                               VersionName(v));
                YIELD ResolveError::VersionMismatch;
            } else {
                YIELD std::move(item);
            }
        }
    }


    Resolutions Resolve(ResolverRef resolver, Version v) {
        return Resolve(std::vector<ResolverRef>{std::move(resolver)}, v);
    }


    Future<optional<Resolution>> BestEffortResolution(std::vector<ResolverRef> resolvers,
                                                      Version v)
    {
        Resolutions items = Resolve(std::move(resolvers), v);
        while (true) {
            Result<Resolution> item = AWAIT items;
            if (item.empty())
                break;
            if (item.ok()) {
                LResolve->info("Found {} address {} ({})",
                               VersionName(v), item->address.toString(),
                               item->details ? item->details->description() : "no details");
                RETURN optional<Resolution>(std::move(item).value());
            }
            Error err = item.error();
            LResolve->info("Skipping {} error: {}", KindName(KindOf(err)), err.description());
        }
        LResolve->warn("No resolver found an {} address", VersionName(v));
        RETURN nullopt;
    }


    Future<optional<Resolution>> BestEffortResolution(ResolverRef resolver, Version v) {
        return BestEffortResolution(std::vector<ResolverRef>{std::move(resolver)}, v);
    }


    Future<optional<IPAddress>> BestEffortAddress(std::vector<ResolverRef> resolvers, Version v) {
        optional<Resolution> resolution = AWAIT BestEffortResolution(std::move(resolvers), v);
        if (!resolution)
            RETURN nullopt;
        RETURN optional<IPAddress>(resolution->address);
    }


    Future<optional<IPAddress>> BestEffortAddress(ResolverRef resolver, Version v) {
        return BestEffortAddress(std::vector<ResolverRef>{std::move(resolver)}, v);
    }

}
