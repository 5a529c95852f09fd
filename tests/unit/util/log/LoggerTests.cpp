//------------------------------------------------------------------------------
/*
    This file is part of chainrelay.
    Copyright (c) 2024, the chainrelay developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include "util/LoggerFixtures.hpp"
#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/parse.hpp>
#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace util;

// Used as a fixture for tests with enabled logging
class LoggerTest : public LoggerFixture {};

// Used as a fixture for tests with disabled logging
class NoLoggerTest : public NoLoggerFixture {};

TEST_F(LoggerTest, Basic)
{
    Logger const log{"General"};
    log.info() << "Info line logged";
    checkEqual("General:NFO Info line logged");

    LogService::debug() << "Debug line with numbers " << 12345;
    checkEqual("General:DBG Debug line with numbers 12345");

    LogService::warn() << "Warning is logged";
    checkEqual("General:WRN Warning is logged");
}

TEST_F(LoggerTest, Filtering)
{
    Logger const log{"Routing"};
    log.trace() << "Should not be logged";
    checkEmpty();

    log.warn() << "Warning is logged";
    checkEqual("Routing:WRN Warning is logged");

    Logger const tlog{"Trace"};
    tlog.trace() << "Trace line logged for 'Trace' component";
    checkEqual("Trace:TRC Trace line logged for 'Trace' component");
}

TEST_F(LoggerTest, AlertChannelOnlyLogsWarningsAndAbove)
{
    LogService::info() << "Skipped";
    getLoggerString();

    Logger const alert{"Alert"};
    alert.info() << "Not an alert";
    checkEmpty();

    alert.error() << "Upstream is down";
    checkEqual("Alert:ERR Upstream is down");
}

TEST_F(LoggerTest, LOGMacro)
{
    Logger const log{"Bootstrap"};

    auto computeCalled = false;
    auto compute = [&computeCalled]() {
        computeCalled = true;
        return "computed";
    };

    LOG(log.trace()) << compute();
    EXPECT_FALSE(computeCalled);

    log.trace() << compute();
    EXPECT_TRUE(computeCalled);
}

TEST_F(NoLoggerTest, Basic)
{
    Logger const log{"Trace"};
    log.trace() << "Nothing";
    checkEmpty();

    LogService::fatal() << "Still nothing";
    checkEmpty();
}

TEST(SeverityTests, Labels)
{
    std::stringstream stream;
    stream << Severity::TRC << Severity::DBG << Severity::NFO << Severity::WRN << Severity::ERR << Severity::FTL;
    EXPECT_EQ(stream.str(), "TRCDBGNFOWRNERRFTL");
}

TEST(SeverityTests, ParseFromConfig)
{
    Config const config{boost::json::parse(R"json({
        "a": "trace", "b": "DEBUG", "c": "info", "d": "warn", "e": "warning", "f": "Error", "g": "fatal"
    })json")};

    EXPECT_EQ(config.value<Severity>("a"), Severity::TRC);
    EXPECT_EQ(config.value<Severity>("b"), Severity::DBG);
    EXPECT_EQ(config.value<Severity>("c"), Severity::NFO);
    EXPECT_EQ(config.value<Severity>("d"), Severity::WRN);
    EXPECT_EQ(config.value<Severity>("e"), Severity::WRN);
    EXPECT_EQ(config.value<Severity>("f"), Severity::ERR);
    EXPECT_EQ(config.value<Severity>("g"), Severity::FTL);
}

TEST(SeverityTests, ParseInvalid)
{
    Config const config{boost::json::parse(R"json({"level": "loud", "number": 3})json")};
    EXPECT_THROW([[maybe_unused]] auto s = config.value<Severity>("level"), std::runtime_error);
    EXPECT_THROW([[maybe_unused]] auto s = config.value<Severity>("number"), std::runtime_error);
}

// LogService::init replaces the fixture's sink; nothing is written to the console with `log_to_console` off
struct LogServiceInitTests : LoggerFixture {};

TEST_F(LogServiceInitTests, InvalidLogLevelFallsBackToDebug)
{
    Config const config{boost::json::parse(R"json({"log_level": "verbose", "log_to_console": false})json")};
    LogService::init(config);

    EXPECT_FALSE(static_cast<bool>(LogService::trace()));
    EXPECT_TRUE(static_cast<bool>(LogService::debug()));
}

TEST_F(LogServiceInitTests, DefaultLevelIsInfo)
{
    Config const config{boost::json::parse(R"json({"log_to_console": false})json")};
    LogService::init(config);

    EXPECT_FALSE(static_cast<bool>(LogService::debug()));
    EXPECT_TRUE(static_cast<bool>(LogService::info()));
}

TEST_F(LogServiceInitTests, ChannelOverride)
{
    Config const config{boost::json::parse(R"json({
        "log_level": "error",
        "log_to_console": false,
        "log_channels": [{"channel": "Routing", "log_level": "trace"}]
    })json")};
    LogService::init(config);

    EXPECT_TRUE(static_cast<bool>(Logger{"Routing"}.trace()));
    EXPECT_FALSE(static_cast<bool>(Logger{"Upstream"}.warn()));
    EXPECT_TRUE(static_cast<bool>(Logger{"Upstream"}.error()));
}

TEST_F(LogServiceInitTests, UnknownChannelOverrideThrows)
{
    Config const config{boost::json::parse(R"json({
        "log_to_console": false,
        "log_channels": [{"channel": "Nope", "log_level": "trace"}]
    })json")};
    EXPECT_THROW(LogService::init(config), std::runtime_error);
}
