//
// Logging.hh
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

#include <spdlog/spdlog.h>

namespace pubip {

    using LoggerRef = spdlog::logger*;
    namespace LogLevel = spdlog::level;
    using LogLevelType = spdlog::level::level_enum;

    /*  Log levels come from the `SPDLOG_LEVEL` environment variable, for example:
            SPDLOG_LEVEL=debug                      everything at debug
            SPDLOG_LEVEL="off,Resolve=info"         only the resolver pipeline
            SPDLOG_LEVEL="info,Net=trace"           packet-level detail for network I/O
     */


    /// Sets up spdlog and the loggers below. Idempotent; the entry points that log call it.
    void InitLogging();


    extern LoggerRef
        Log,        // default
        LSched,     // coroutine scheduling
        LLoop,      // event loop
        LNet,       // sockets, TLS, DNS and HTTP transport
        LResolve;   // resolver pipeline


    /// Returns a logger with the given name, creating it if needed.
    LoggerRef MakeLogger(string_view name, LogLevelType = LogLevel::info);

    /// Sends all PubIP logging to another sink as well.
    void AddSink(spdlog::sink_ptr);

}
