//
// Result.hh
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
#include "Error.hh"

#include <variant>

namespace pubip {

    /** One of three things: a `T`, an `Error`, or nothing at all.
        A Resolutions sequence yields `Result<Resolution>` items (an empty item marks the end),
        and a `Future<T>` stores its outcome in one. `Result<void>` just records success. */
    template <typename T>
    class Result {
    public:
        using TT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

        Result() = default;
        Result(Error err)                           :_var(err) { }
        Result(ErrorDomain auto code)               :_var(Error(code)) { }

        template <typename U> requires (!std::is_void_v<T> && std::constructible_from<T, U>
                                        && !std::is_same_v<std::remove_cvref_t<U>, Result>)
        Result(U&& val)                             :_var(std::in_place_index<0>, std::forward<U>(val)) { }

        template <typename U> requires (!std::is_void_v<T> && std::constructible_from<T, U>
                                        && !std::is_same_v<std::remove_cvref_t<U>, Result>)
        Result& operator=(U&& val)                  {set(std::forward<U>(val)); return *this;}

        Result& operator=(Error err)                {_var = err; return *this;}

        template <typename U> requires (!std::is_void_v<T> && std::constructible_from<T, U>)
        void set(U&& val)                           {_var.template emplace<0>(std::forward<U>(val));}
        void set()  requires (std::is_void_v<T>)    {_var.template emplace<0>();}

        bool ok() const                             {return _var.index() == 0;}
        bool empty() const                          {return !ok() && !errorRef();}
        bool isError() const                        {return !ok() && errorRef();}

        /// False if empty, true if it has a value; raises the error if it has one.
        explicit operator bool() const {
            if (ok())
                return true;
            errorRef().raise_if();
            return false;
        }

        /// The error, or `noerror` if there's a value or nothing.
        Error error() const                         {return ok() ? noerror : errorRef();}

        /// The value. Raises the error instead if there is one, or `PubIPError::EmptyResult`
        /// if the Result is empty.
        TT const& value() const &  requires (!std::is_void_v<T>) {check(); return std::get<0>(_var);}
        TT& value() &  requires (!std::is_void_v<T>)              {check(); return std::get<0>(_var);}
        TT&& value() &&  requires (!std::is_void_v<T>)            {check(); return std::get<0>(std::move(_var));}
        void value() const &  requires (std::is_void_v<T>)        {check();}

        TT& operator*()              requires (!std::is_void_v<T>)  {return value();}
        TT const& operator*() const  requires (!std::is_void_v<T>)  {return value();}
        TT* operator->()             requires (!std::is_void_v<T>)  {return &value();}
        TT const* operator->() const requires (!std::is_void_v<T>)  {return &value();}

    private:
        Error const& errorRef() const               {return std::get<1>(_var);}

        void check() const {
            if (!ok()) {
                if (Error err = errorRef())
                    err.raise();
                Error::raise(PubIPError::EmptyResult);
            }
        }

        std::variant<TT,Error> _var {std::in_place_index<1>};
    };

}
