#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Call this once at the beginning of the host application.
    // Creates console + rotating file sinks under logs/.
    void initialize(const std::string& base_log_filename = "momentum_screener",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Same as above, driven by the "logging" section of the screener config
    void initialize(const config::LoggingConfig& logging_config);

    // Get the globally configured logger.
    // If initialize() was never called a console-only logger (warn level) is created on first use.
    std::shared_ptr<spdlog::logger> getLogger();

    // Helper function to set log level from string (useful for env vars/config)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
