#include <catch2/catch_test_macros.hpp>
#include "../../include/Logger.h"

TEST_CASE("parseLogLevel maps level names", "[Logger]") {
    REQUIRE(parseLogLevel("trace") == LogLevel::TRACE);
    REQUIRE(parseLogLevel("DEBUG") == LogLevel::DEBUG);
    REQUIRE(parseLogLevel("Info") == LogLevel::INFO);
    REQUIRE(parseLogLevel("warn") == LogLevel::WARNING);
    REQUIRE(parseLogLevel("warning") == LogLevel::WARNING);
    REQUIRE(parseLogLevel("error") == LogLevel::ERR);
    REQUIRE(parseLogLevel("off") == LogLevel::NONE);

    SECTION("Unknown names use the fallback") {
        REQUIRE(parseLogLevel("loud") == LogLevel::INFO);
        REQUIRE(parseLogLevel("", LogLevel::ERR) == LogLevel::ERR);
    }
}

TEST_CASE("Logger honours the configured level", "[Logger]") {
    Logger& logger = Logger::getInstance();
    const LogLevel previous = logger.getLogLevel();

    logger.setLogLevel(LogLevel::WARNING);
    REQUIRE_FALSE(logger.isEnabled(LogLevel::INFO));
    REQUIRE(logger.isEnabled(LogLevel::WARNING));
    REQUIRE(logger.isEnabled(LogLevel::ERR));
    REQUIRE_FALSE(logger.isEnabled(LogLevel::NONE));

    logger.setLogLevel(previous);
}
