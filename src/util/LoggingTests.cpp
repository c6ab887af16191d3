// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/Catch2.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"

namespace deepcheck
{

TEST_CASE("log level names", "[logging]")
{
    REQUIRE(Logging::getLLfromString("fatal") == LogLevel::LVL_FATAL);
    REQUIRE(Logging::getLLfromString("ERROR") == LogLevel::LVL_ERROR);
    REQUIRE(Logging::getLLfromString("Warning") == LogLevel::LVL_WARNING);
    REQUIRE(Logging::getLLfromString("debug") == LogLevel::LVL_DEBUG);
    REQUIRE(Logging::getLLfromString("trace") == LogLevel::LVL_TRACE);
    REQUIRE(Logging::getLLfromString("anything") == LogLevel::LVL_INFO);
}

TEST_CASE("partition log levels", "[logging]")
{
    auto global = Logging::getLogLevel("Dump");
    Logging::setLogLevel(LogLevel::LVL_TRACE, "Check");
    REQUIRE(Logging::getLogLevel("Check") == LogLevel::LVL_TRACE);
    REQUIRE(Logging::getLogLevel("Dump") == global);
    REQUIRE(Logging::getCheckLogPtr()->should_log(spdlog::level::trace));

    Logging::setLogLevel(global, nullptr);
    REQUIRE(Logging::getLogLevel("Check") == global);
}

TEST_CASE("release assertions throw", "[logging]")
{
    REQUIRE_NOTHROW(releaseAssertOrThrow(1 + 1 == 2));
    REQUIRE_THROWS_AS(releaseAssertOrThrow(1 + 1 == 3), std::runtime_error);
}
}
