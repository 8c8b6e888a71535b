//
// Resolve.hh
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
#include "Future.hh"
#include "Resolver.hh"

#include <optional>

namespace pubip {

    /// Runs the resolvers in order and returns every attempt's outcome, validated against the
    /// requested Version: an address of the wrong family is replaced in place by a
    /// `ResolveError::VersionMismatch` error. Errors pass through unchanged.
    Resolutions Resolve(std::vector<ResolverRef> resolvers, Version);
    Resolutions Resolve(ResolverRef resolver, Version);


    /// Returns the first address (with its details) of the requested Version that any resolver
    /// finds, or nullopt if they all fail. Errors are logged and skipped, and no resolver is
    /// started after one succeeds.
    ASYNC<std::optional<Resolution>> BestEffortResolution(std::vector<ResolverRef> resolvers,
                                                          Version);
    ASYNC<std::optional<Resolution>> BestEffortResolution(ResolverRef resolver, Version);


    /// Like `BestEffortResolution`, but returns only the address.
    ASYNC<std::optional<IPAddress>> BestEffortAddress(std::vector<ResolverRef> resolvers, Version);
    ASYNC<std::optional<IPAddress>> BestEffortAddress(ResolverRef resolver, Version);

}
