#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace waypoint::control {
struct LogConfig;
}

namespace waypoint::logging {

// Start the Quill backend thread (called once at startup)
void init_logging_system();

// Build the process logger from config ("-" or empty output selects the console sink)
quill::Logger* init_logger(const waypoint::control::LogConfig& config);

// Stop the Quill backend (called at exit)
void shutdown_logging();

// Process logger; falls back to a console logger when init_logger was never called
quill::Logger* get_current_logger();

// Fetch outcome logging
#define LOG_FETCH(logger, source, url, outcome, duration_ms)                                \
    LOG_INFO(logger, "Upstream fetch {}: source={}, url={}, duration_ms={}", outcome, source, \
             url, duration_ms)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, component, error_code, error_detail)                \
    LOG_ERROR(logger, "{}: component={}, error_code={}, error_detail={}", message, component, \
              error_code, error_detail)

}  // namespace waypoint::logging
