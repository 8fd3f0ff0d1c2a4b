#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include "../control/config.hpp"

namespace waypoint::logging {

namespace {

constexpr const char* kLoggerName = "waypoint";

std::atomic<quill::Logger*> g_current_logger{nullptr};

quill::Logger* make_console_logger() {
  auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("waypoint_console");
  return quill::Frontend::create_or_get_logger(kLoggerName, std::move(console_sink));
}

}  // namespace

void init_logging_system() {
  quill::Backend::start();
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
  quill::Logger* logger = nullptr;

  if (log_config.output.empty() || log_config.output == "-") {
    logger = make_console_logger();
  } else {
    std::error_code ec;
    std::filesystem::create_directories(log_config.output, ec);
    if (ec) {
      fprintf(stderr, "Cannot create log directory %s: %s (logging to console)\n",
              log_config.output.c_str(), ec.message().c_str());
      logger = make_console_logger();
    } else {
      quill::RotatingFileSinkConfig config;
      config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
      config.set_max_backup_files(log_config.rotation.max_files);
      config.set_open_mode('a');

      std::string log_path = fmt::format("{}/waypoint.log", log_config.output);

      if (log_config.format == "json") {
        auto json_sink =
            quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, config);
        logger = quill::Frontend::create_or_get_logger(kLoggerName, std::move(json_sink));
      } else {
        auto file_sink =
            quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
        logger = quill::Frontend::create_or_get_logger(kLoggerName, std::move(file_sink));
      }
    }
  }

  std::string level_lower = log_config.level;
  std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(), ::tolower);

  if (level_lower == "debug") {
    logger->set_log_level(quill::LogLevel::Debug);
  } else if (level_lower == "info") {
    logger->set_log_level(quill::LogLevel::Info);
  } else if (level_lower == "warning" || level_lower == "warn") {
    logger->set_log_level(quill::LogLevel::Warning);
  } else if (level_lower == "error") {
    logger->set_log_level(quill::LogLevel::Error);
  } else {
    logger->set_log_level(quill::LogLevel::Info);
  }

  g_current_logger.store(logger, std::memory_order_release);
  return logger;
}

void shutdown_logging() {
  if (auto* logger = g_current_logger.load(std::memory_order_acquire)) {
    logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_current_logger() {
  quill::Logger* logger = g_current_logger.load(std::memory_order_acquire);
  if (logger == nullptr) {
    logger = make_console_logger();
    g_current_logger.store(logger, std::memory_order_release);
  }
  return logger;
}

}  // namespace waypoint::logging
