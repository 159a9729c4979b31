#pragma once

/// @file log.hpp
/// @brief Subsystem loggers for the region host

#include <spdlog/spdlog.h>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace rhost_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Sinks and level shared by every subsystem logger (the [logging] table of region.toml)
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Apply a configuration. Loggers that already exist get fresh sinks and the
/// new level, so call this before the scene starts serving other threads.
void configure_logging(const LogConfig& config);

/// Parse a level name as written in region.toml
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

// =============================================================================
// Subsystem Loggers
// =============================================================================

/// Get or create a named logger using the current configuration
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Id allocation and other core services ("rhost_core")
std::shared_ptr<spdlog::logger> core_logger();

/// Scene lifecycle ("scene")
std::shared_ptr<spdlog::logger> scene_logger();

/// Module attachment, capabilities and teardown ("modules")
std::shared_ptr<spdlog::logger> modules_logger();

/// Commander and command registration ("commands")
std::shared_ptr<spdlog::logger> commands_logger();

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// Traces entry and exit of a block, with its duration
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "rhost_core");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define RHOST_LOG_SCOPE(name, logger_name) ::rhost_core::LogScope rhost_log_scope_(name, logger_name)

/// Flush and drop every subsystem logger
void shutdown_logging();

} // namespace rhost_core
