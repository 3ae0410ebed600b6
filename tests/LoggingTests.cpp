// LoggingTests.cpp
#include <catch2/catch.hpp>

#include "LiveReload/Logging.hpp"
#include "TestUtils.h"

#include <fstream>
#include <iterator>
#include <string>

using namespace ReloadLogging;

TEST_CASE("Log levels parse case-insensitively", "[logging]") {
    LogLevel level = LogLevel::Info;

    REQUIRE(ParseLogLevel("TRACE", level));
    REQUIRE(level == LogLevel::Trace);
    REQUIRE(ParseLogLevel("warning", level));
    REQUIRE(level == LogLevel::Warn);
    REQUIRE(ParseLogLevel("Critical", level));
    REQUIRE(level == LogLevel::Critical);

    REQUIRE_FALSE(ParseLogLevel("verbose", level));
    REQUIRE(level == LogLevel::Critical);

    REQUIRE(std::string(ToString(LogLevel::Error)) == "error");
}

TEST_CASE("Concat streams every argument", "[logging]") {
    REQUIRE(Concat("state ", 8, " -> ", 12.5, " bytes") == "state 8 -> 12.5 bytes");
    REQUIRE(Concat().empty());
}

TEST_CASE("The file sink receives logged messages", "[logging]") {
    TestUtils::TempDir dir;
    const std::string logFile = dir.File("logs/livereload.log");

    LogSettings settings;
    settings.level = LogLevel::Debug;
    settings.filePath = logFile;

    REQUIRE(Initialize(settings));
    REQUIRE(IsInitialized());

    LIVERELOAD_PRINT(LogLevel::Debug, "[Test] value=", 42, "\n");
    LIVERELOAD_PRINT(LogLevel::Trace, "[Test] filtered out");
    LogWarn("[Test] warning line");

    Shutdown();
    REQUIRE_FALSE(IsInitialized());

    std::ifstream in(logFile);
    const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(contents.find("[debug] [Test] value=42") != std::string::npos);
    REQUIRE(contents.find("[Test] warning line") != std::string::npos);
    REQUIRE(contents.find("filtered out") == std::string::npos);
}
