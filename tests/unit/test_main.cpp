// Waypoint Unit Tests - Main Entry Point
#include <catch2/catch_test_macros.hpp>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        waypoint::logging::init_logging_system();

        waypoint::control::LogConfig log_config;
        log_config.output = "/tmp/waypoint_tests";
        waypoint::logging::init_logger(log_config);
    }

    ~GlobalSetup() { waypoint::logging::shutdown_logging(); }
};

// Create global instance to run setup/teardown
static GlobalSetup g_setup;

TEST_CASE("Basic sanity test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
}
