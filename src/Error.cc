//
// Error.cc
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

#include "Error.hh"
#include "Internal.hh"
#include "util/Logging.hh"

#include <functional>
#include <optional>
#include <ostream>
#include <regex>
#include <new>
#include <system_error>
#include <variant>

namespace pubip {
    using namespace std;


    string Error::description() const {
        if (_domain && _domain->description) {
            if (string desc = _domain->description(_code); !desc.empty())
                return desc;
        }
        return brief();
    }


    string Error::brief() const {
        if (!_domain)
            return "(no error)";
        return fmt::format("{} error {}", _domain->name, _code);
    }


    std::ostream& operator<< (std::ostream& out, Error const& err) {
        return out << err.description();
    }


    void Error::raise(string_view logMessage, std::source_location const& loc) const {
        precondition(*this);
        InitLogging();
        Log->debug("Throwing {} ({}) [{}] at {}:{}",
                   description(), brief(), logMessage, loc.file_name(), loc.line());
        throw Exception(*this);
    }


    string NameEntry::lookup(int code, span<const NameEntry> table) {
        for (auto &entry : table) {
            if (entry.code == code)
                return entry.name;
        }
        return "";
    }


    string ErrorDomainInfo<PubIPError>::description(errorcode_t code) {
        using enum PubIPError;
        static constexpr NameEntry names[] = {
            {errorcode_t(Cancelled),    "operation was cancelled"},
            {errorcode_t(EmptyResult),  "internal error: empty Result"},
            {errorcode_t(InvalidState), "internal error: invalid state"},
            {errorcode_t(InvalidURL),   "invalid URL"},
            {errorcode_t(LogicError),   "internal error (logic error)"},
            {errorcode_t(ParseError),   "unreadable data"},
            {errorcode_t(Timeout),      "operation timed out"},
        };
        return NameEntry::lookup(code, names);
    }


#pragma mark - EXCEPTIONS:


    string ErrorDomainInfo<CppError>::description(errorcode_t code) {
        using enum CppError;
        static constexpr NameEntry names[] = {
            {errorcode_t(exception),            "std::exception"},
            {errorcode_t(logic_error),          "std::logic_error"},
            {errorcode_t(invalid_argument),     "std::invalid_argument"},
            {errorcode_t(out_of_range),         "std::out_of_range"},
            {errorcode_t(length_error),         "std::length_error"},
            {errorcode_t(runtime_error),        "std::runtime_error"},
            {errorcode_t(range_error),          "std::range_error"},
            {errorcode_t(overflow_error),       "std::overflow_error"},
            {errorcode_t(regex_error),          "std::regex_error"},
            {errorcode_t(system_error),         "std::system_error"},
            {errorcode_t(bad_cast),             "std::bad_cast"},
            {errorcode_t(bad_optional_access),  "std::bad_optional_access"},
            {errorcode_t(bad_variant_access),   "std::bad_variant_access"},
            {errorcode_t(bad_function_call),    "std::bad_function_call"},
            {errorcode_t(bad_alloc),            "std::bad_alloc"},
        };
        return NameEntry::lookup(code, names);
    }


    // Subclasses must be tested before their base classes.
    static CppError ClassifyException(std::exception const& x) {
        using enum CppError;
        if (dynamic_cast<std::invalid_argument const*>(&x))      return invalid_argument;
        if (dynamic_cast<std::out_of_range const*>(&x))          return out_of_range;
        if (dynamic_cast<std::length_error const*>(&x))          return length_error;
        if (dynamic_cast<std::logic_error const*>(&x))           return logic_error;
        if (dynamic_cast<std::range_error const*>(&x))           return range_error;
        if (dynamic_cast<std::overflow_error const*>(&x))        return overflow_error;
        if (dynamic_cast<std::regex_error const*>(&x))           return regex_error;
        if (dynamic_cast<std::system_error const*>(&x))          return system_error;
        if (dynamic_cast<std::runtime_error const*>(&x))         return runtime_error;
        if (dynamic_cast<std::bad_optional_access const*>(&x))   return bad_optional_access;
        if (dynamic_cast<std::bad_variant_access const*>(&x))    return bad_variant_access;
        if (dynamic_cast<std::bad_cast const*>(&x))              return bad_cast;
        if (dynamic_cast<std::bad_function_call const*>(&x))     return bad_function_call;
        if (dynamic_cast<std::bad_alloc const*>(&x))             return bad_alloc;
        return exception;
    }


    Error::Error(std::exception const& x) {
        if (auto exc = dynamic_cast<Exception const*>(&x))
            *this = exc->error();
        else
            *this = ClassifyException(x);
    }


    Error::Error(std::exception_ptr xp) {
        if (!xp)
            return;
        try {
            std::rethrow_exception(xp);
        } catch (std::exception const& x) {
            *this = Error(x);
        } catch (...) {
            *this = CppError::exception;
        }
    }

}
