//
// Logging.cc
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

#include "util/Logging.hh"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <mutex>
#include <vector>

namespace pubip {
    using namespace std;

    LoggerRef Log, LSched, LLoop, LNet, LResolve;

    static constexpr const char* kLogPattern = "%H:%M:%S.%e %^%L%$ [%n] %v";

    // Every PubIP logger writes to all of these:
    static vector<spdlog::sink_ptr> sSinks;


    // Returns the named logger, creating it on the shared sinks if necessary.
    static LoggerRef getLogger(string_view name, LogLevelType level) {
        shared_ptr<spdlog::logger> logger = spdlog::get(string(name));
        if (!logger) {
            logger = make_shared<spdlog::logger>(string(name), sSinks.begin(), sSinks.end());
            logger->set_level(level);
            spdlog::register_logger(logger);
        }
        return logger.get();
    }


    void InitLogging() {
        static once_flag sOnce;
        call_once(sOnce, [] {
            auto console = make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_pattern(kLogPattern);
            sSinks.push_back(console);

            auto dflt = make_shared<spdlog::logger>("PubIP", console);
            spdlog::set_default_logger(dflt);
            Log = dflt.get();

            LSched   = getLogger("Sched",   LogLevel::info);
            LLoop    = getLogger("Loop",    LogLevel::info);
            LNet     = getLogger("Net",     LogLevel::info);
            LResolve = getLogger("Resolve", LogLevel::info);

            // SPDLOG_LEVEL overrides the levels above:
            spdlog::cfg::load_env_levels();
            spdlog::flush_on(LogLevel::warn);
            spdlog::flush_every(chrono::seconds(5));

            assert_failed_hook = [](const char* message) {
                Log->critical("{}", message);
                Log->flush();
            };
            Log->debug("Logging initialized");
        });
    }


    LoggerRef MakeLogger(string_view name, LogLevelType level) {
        InitLogging();
        return getLogger(name, level);
    }


    void AddSink(spdlog::sink_ptr sink) {
        InitLogging();
        sink->set_pattern(kLogPattern);
        sSinks.push_back(sink);
        spdlog::apply_all([&](shared_ptr<spdlog::logger> logger) {
            logger->sinks().push_back(sink);
        });
    }

}
