/// @file log.cpp
/// @brief Subsystem logger registry

#include <rhost/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace rhost_core {

namespace {

struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    LogConfig config;
};

LoggerRegistry& registry() {
    static LoggerRegistry instance;
    return instance;
}

/// Console sink plus one rotating file per subsystem when file logging is on
std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console);
    }

    if (config.file_enabled) {
        std::filesystem::path dir = config.log_directory.empty() ? "." : config.log_directory;
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (dir / (name + ".log")).string(), config.max_file_size, config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Region log file for '{}' unavailable: {}", name, e.what());
        }
    }

    return sinks;
}

} // anonymous namespace

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;
    for (auto& [name, logger] : reg.loggers) {
        logger->sinks() = make_sinks(reg.config, name);
        logger->set_level(reg.config.level);
    }
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    auto sinks = make_sinks(reg.config, name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.config.level);
    reg.loggers.emplace(name, logger);
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("rhost_core");
    return logger;
}

std::shared_ptr<spdlog::logger> scene_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("scene");
    return logger;
}

std::shared_ptr<spdlog::logger> modules_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("modules");
    return logger;
}

std::shared_ptr<spdlog::logger> commands_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("commands");
    return logger;
}

LogScope::LogScope(const std::string& name, const std::string& logger_name)
    : m_name(name)
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("<<< {} ({}us)", m_name, elapsed.count());
}

void shutdown_logging() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    reg.loggers.clear();
}

} // namespace rhost_core
