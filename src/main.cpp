/*
 * Copyright 2025 Waypoint Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


// Waypoint - Main Entry Point
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "runtime/orchestrator.hpp"

namespace {

// Set by the signal handler, consumed by the main loop
std::atomic<bool> g_running{true};
std::atomic<bool> g_reload_requested{false};

void print_validation(const waypoint::control::ValidationResult& validation) {
    for (const auto& error : validation.errors) {
        fprintf(stderr, "  - %s\n", error.c_str());
    }
    for (const auto& warning : validation.warnings) {
        fprintf(stderr, "  warning: %s\n", warning.c_str());
    }
}

}  // namespace

extern "C" void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    } else if (signal == SIGHUP) {
        g_reload_requested = true;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3 || std::string(argv[1]) != "--config") {
        fprintf(stderr, "Usage: %s --config <config.json>\n", argv[0]);
        return EXIT_FAILURE;
    }

    auto config_manager = std::make_unique<waypoint::control::ConfigManager>();
    if (!config_manager->load(argv[2])) {
        fprintf(stderr, "Failed to load configuration from %s\n", argv[2]);
        print_validation(config_manager->last_validation());
        return EXIT_FAILURE;
    }

    auto config = config_manager->get();

    waypoint::logging::init_logging_system();
    auto* logger = waypoint::logging::init_logger(config->logging);
    for (const auto& warning : config_manager->last_validation().warnings) {
        LOG_WARNING(logger, "Configuration warning: {}", warning);
    }

    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal
    std::signal(SIGHUP, signal_handler);   // Config reload

    waypoint::runtime::Orchestrator orchestrator(config);
    if (auto ec = orchestrator.start()) {
        LOG_ERROR(logger, "Startup failed: {}", ec.message());
        waypoint::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (!g_reload_requested.exchange(false)) {
            continue;
        }

        LOG_INFO(logger, "Received SIGHUP, reloading configuration from {}",
                 config_manager->config_path());
        if (config_manager->reload()) {
            orchestrator.apply_config(config_manager->get());
            LOG_INFO(logger, "Configuration reloaded");
        } else {
            for (const auto& error : config_manager->last_validation().errors) {
                LOG_ERROR(logger, "Configuration reload rejected: {}", error);
            }
        }
    }

    LOG_INFO(logger, "Shutdown signal received, stopping");
    orchestrator.stop();
    waypoint::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
