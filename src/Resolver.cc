//
// Resolver.cc
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

#include "Resolver.hh"
#include "util/Logging.hh"

namespace pubip {
    using namespace std;


    Resolutions Fallback(std::vector<ResolverRef> resolvers, Version v) {
        InitLogging();
        for (auto& resolver : resolvers) {
            precondition(resolver);
            LResolve->debug("Trying {} for {}", resolver->name(), VersionName(v));
            Resolutions items = resolver->resolve(v);
            while (true) {
                Result<Resolution> item = AWAIT items;
                if (item.empty())
                    break;
                YIELD std::move(item);
            }
        }
    }


    string ResolverList::name() const {
        return "list of " + to_string(_resolvers.size());
    }


    static Resolutions YieldOnce(Error err) {
        YIELD err;
    }


    Resolutions ResultResolver::resolve(Version v) const {
        if (_r.ok())
            return _r.value()->resolve(v);
        else if (_r.isError())
            return YieldOnce(_r.error());
        else
            return YieldOnce(PubIPError::EmptyResult);
    }


    string ResultResolver::name() const {
        return _r.ok() ? _r.value()->name() : "failed resolver";
    }

}
