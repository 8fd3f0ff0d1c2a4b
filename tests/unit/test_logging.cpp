// Waypoint Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

using namespace waypoint;

TEST_CASE("Process logger is available", "[logging]") {
    auto* logger = logging::get_current_logger();
    REQUIRE(logger != nullptr);

    SECTION("repeated lookups return the same logger") {
        REQUIRE(logging::get_current_logger() == logger);
    }
}

TEST_CASE("Structured logging macros format their fields", "[logging][macros]") {
    auto* logger = logging::get_current_logger();
    REQUIRE(logger != nullptr);

    LOG_FETCH(logger, "pangolin", "http://pangolin:3001/api/v1/traefik-config", "succeeded",
              12);
    LOG_ERROR_CTX(logger, "Fetch failed", "upstream", "transport_failed", "connection refused");
    logger->flush_log();

    SUCCEED();
}

TEST_CASE("Log config defaults select the console sink", "[logging][config]") {
    control::LogConfig config;
    REQUIRE(config.output == "-");
    REQUIRE(config.level == "info");
    REQUIRE(config.rotation.max_files == 10);
}
