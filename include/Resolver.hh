//
// Resolver.hh
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
#include "Generator.hh"
#include "Resolution.hh"

#include <array>
#include <concepts>
#include <initializer_list>
#include <span>
#include <vector>

namespace pubip {

    /// A lazy, finite sequence of resolution attempts. Each item is an address (with details)
    /// or an Error; an error item does not end the sequence.
    using Resolutions = Generator<Resolution>;


    /** Abstract interface of anything that can look up the public IP address.
        A Resolver is immutable configuration: `resolve` may be called any number of times,
        and each call returns an independent sequence. No I/O happens until that sequence is
        pulled. */
    class Resolver {
    public:
        virtual ~Resolver() = default;

        /// Returns a fresh sequence of attempts to find an address of the given Version.
        virtual Resolutions resolve(Version) const =0;

        /// A short name for logging.
        virtual string name() const                 {return "resolver";}
    };

    using ResolverRef = std::shared_ptr<const Resolver>;


    /// Drives each resolver in order, concatenating their sequences: all of `resolvers[0]`'s
    /// items, then all of `resolvers[1]`'s, and so on. A resolver is only started once the
    /// previous one's sequence is exhausted; items pass through unchanged.
    Resolutions Fallback(std::vector<ResolverRef> resolvers, Version);


    /** An ordered collection of resolvers, which is itself a Resolver. */
    class ResolverList final : public Resolver {
    public:
        ResolverList() = default;
        ResolverList(std::initializer_list<ResolverRef> rs)     :_resolvers(rs) { }
        explicit ResolverList(std::vector<ResolverRef> rs)      :_resolvers(std::move(rs)) { }
        explicit ResolverList(std::span<const ResolverRef> rs)  :_resolvers(rs.begin(), rs.end()) { }
        template <size_t N>
        explicit ResolverList(std::array<ResolverRef,N> const& rs) :_resolvers(rs.begin(), rs.end()) { }

        std::vector<ResolverRef> const& resolvers() const   {return _resolvers;}
        size_t size() const                                 {return _resolvers.size();}
        bool empty() const                                  {return _resolvers.empty();}

        Resolutions resolve(Version v) const override       {return Fallback(_resolvers, v);}
        string name() const override;

    private:
        std::vector<ResolverRef> _resolvers;
    };


    /// A type that can act as a resolver without subclassing Resolver.
    template <typename R>
    concept ResolverLike = std::copy_constructible<R> && requires(R const& r, Version v) {
        {r.resolve(v)} -> std::same_as<Resolutions>;
    };


    /** Adapts any ResolverLike value to the Resolver interface. */
    template <ResolverLike R>
    class BoxedResolver final : public Resolver {
    public:
        explicit BoxedResolver(R r)                         :_r(std::move(r)) { }
        Resolutions resolve(Version v) const override       {return _r.resolve(v);}
        R const& unboxed() const                            {return _r;}
    private:
        R _r;
    };

    /// Wraps a ResolverLike value in a ResolverRef.
    template <ResolverLike R>
    ResolverRef Box(R r) {
        if constexpr (std::derived_from<R, Resolver>)
            return std::make_shared<R>(std::move(r));
        else
            return std::make_shared<BoxedResolver<R>>(std::move(r));
    }


    /** A resolver whose configuration may have failed to build: if it holds an Error, `resolve`
        yields that error once; otherwise it delegates. */
    class ResultResolver final : public Resolver {
    public:
        explicit ResultResolver(Result<ResolverRef> r)      :_r(std::move(r)) { }
        Resolutions resolve(Version) const override;
        string name() const override;
    private:
        Result<ResolverRef> _r;
    };

}
