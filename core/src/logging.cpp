#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>
#include <memory>
#include <mutex>
#include <iostream>
#include <cstdlib>
#include <chrono>       // For timestamp in filename
#include <sstream>      // For formatting filename
#include <iomanip>      // For std::put_time
#include <filesystem>   // For creating directory (C++17)
#include <algorithm>    // For std::min, std::transform
#include <cctype>       // For std::tolower

namespace core {
namespace logging {

    namespace {

        const char* kLoggerName = "ScreenerLogger";
        const char* kUtcPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";

        std::shared_ptr<spdlog::logger> global_logger;
        std::mutex logger_mutex;

        std::string makeLogFilePath(const std::string& base_log_filename) {
            // --- Create Log Directory ---
            std::string log_dir = "logs";
            try {
                if (!std::filesystem::exists(log_dir)) {
                    std::filesystem::create_directories(log_dir);
                    std::cout << "[Logging] Created log directory: " << log_dir << std::endl;
                }
            } catch (const std::filesystem::filesystem_error& fs_err) {
                std::cerr << "[Logging] Error creating log directory '" << log_dir << "': " << fs_err.what() << std::endl;
                log_dir = "."; // Fallback
            }

            // --- Generate Log Filename with UTC Timestamp ---
            auto now = std::chrono::system_clock::now();
            auto itt = std::chrono::system_clock::to_time_t(now);
            std::tm utc_tm;
            #ifdef _WIN32
                gmtime_s(&utc_tm, &itt);
            #else
                gmtime_r(&itt, &utc_tm);
            #endif

            std::ostringstream filename_oss;
            filename_oss << base_log_filename << "_" << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ") << ".log";
            return log_dir + "/" + filename_oss.str();
        }

        // Caller holds logger_mutex
        void installLogger(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level) {
            if (global_logger) {
                spdlog::drop(kLoggerName);
            }
            global_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            global_logger->set_level(level);
            global_logger->flush_on(spdlog::level::err);
            spdlog::register_logger(global_logger);
            spdlog::set_default_logger(global_logger);
        }

    } // end anonymous namespace

    void initialize(const std::string& base_log_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level)
    {
        try {
            // --- Check Environment Variable for Override ---
            const char* env_level_cstr = std::getenv("SPDLOG_LEVEL");
            if (env_level_cstr) {
                std::string env_level_str(env_level_cstr);
                spdlog::level::level_enum env_level = level_from_string(env_level_str);
                console_level = env_level;
                file_level = env_level;
                std::cout << "[Logging] Overriding log level from SPDLOG_LEVEL environment variable to: "
                          << env_level_str << std::endl;
            }

            std::string log_file_path = makeLogFilePath(base_log_filename);
            std::cout << "[Logging] Log file path: " << log_file_path << std::endl;

            // --- Create Sinks ---
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(console_level);
            console_sink->set_pattern(kUtcPattern);

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, 1024 * 1024 * 10, 5, true);
            file_sink->set_level(file_level);
            file_sink->set_pattern(kUtcPattern);

            {
                std::lock_guard<std::mutex> lock(logger_mutex);
                installLogger({console_sink, file_sink}, std::min(console_level, file_level));
            }

            #ifdef NDEBUG
                const char* build_type_str = "Release";
            #else
                const char* build_type_str = "Debug";
            #endif

            getLogger()->info("Logging initialized (Build Type: {}). Console: {}, File: {} (UTC)",
                              build_type_str,
                              spdlog::level::to_string_view(console_level),
                              spdlog::level::to_string_view(file_level));

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        } catch (const std::filesystem::filesystem_error& fs_err) {
            std::cerr << "Log initialization failed (Filesystem Error): " << fs_err.what() << std::endl;
        }
    }

    void initialize(const config::LoggingConfig& logging_config) {
        auto console_level = level_from_string(logging_config.console_level);
        if (logging_config.file_enabled) {
            initialize(logging_config.base_file_name, console_level, level_from_string(logging_config.file_level));
            return;
        }

        // Console only
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(console_level);
        console_sink->set_pattern(kUtcPattern);
        {
            std::lock_guard<std::mutex> lock(logger_mutex);
            installLogger({console_sink}, console_level);
        }
        getLogger()->info("Logging initialized (console only). Console: {}",
                          spdlog::level::to_string_view(console_level));
    }

    std::shared_ptr<spdlog::logger> getLogger() {
        std::lock_guard<std::mutex> lock(logger_mutex);
        if (!global_logger) {
            // Library use without an explicit initialize(): quiet console logger
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(kUtcPattern);
            auto level = spdlog::level::warn;
            const char* env_level_cstr = std::getenv("SPDLOG_LEVEL");
            if (env_level_cstr) {
                level = level_from_string(env_level_cstr);
            }
            installLogger({console_sink}, level);
        }
        return global_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string lower_str = level_str;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (lower_str == "trace") return spdlog::level::trace;
        if (lower_str == "debug") return spdlog::level::debug;
        if (lower_str == "info") return spdlog::level::info;
        if (lower_str == "warn" || lower_str == "warning") return spdlog::level::warn;
        if (lower_str == "error" || lower_str == "err") return spdlog::level::err;
        if (lower_str == "critical" || lower_str == "crit") return spdlog::level::critical;
        if (lower_str == "off") return spdlog::level::off;
        std::cerr << "[Logging] Unrecognized log level string: '" << level_str << "'. Defaulting to 'info'." << std::endl;
        return spdlog::level::info;
    }

} // namespace logging
} // namespace core
