/// @file error.cpp
/// @brief Error handling implementation for rhost_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Global error statistics

#include <rhost/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace rhost_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_module_error(const ModuleError& err) {
    std::ostringstream oss;
    oss << "[ModuleError] " << err.message;

    if (!err.module_name.empty()) {
        oss << " (module: " << err.module_name << ")";
    }

    return oss.str();
}

std::string format_command_error(const CommandError& err) {
    std::ostringstream oss;
    oss << "[CommandError] " << err.message;

    if (!err.commander.empty()) {
        oss << " (commander: " << err.commander << ")";
    }
    if (!err.owner.empty()) {
        oss << " (owner: " << err.owner << ")";
    }

    return oss.str();
}

std::string format_id_error(const IdError& err) {
    std::ostringstream oss;
    oss << "[IdError] " << err.message;
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.source.empty()) {
        oss << " (source: " << err.source << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ModuleError>) {
            oss << detail::format_module_error(err);
        } else if constexpr (std::is_same_v<T, CommandError>) {
            oss << detail::format_command_error(err);
        } else if constexpr (std::is_same_v<T, IdError>) {
            oss << detail::format_id_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

/// Global error statistics for debugging
struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> module_errors{0};
    std::atomic<std::uint64_t> command_errors{0};
    std::atomic<std::uint64_t> id_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

/// Record error occurrence
void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<ModuleError>()) {
        s_error_stats.module_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<CommandError>()) {
        s_error_stats.command_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<IdError>()) {
        s_error_stats.id_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

/// Get total error count
std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t module_error_count() {
    return s_error_stats.module_errors.load(std::memory_order_relaxed);
}

/// Reset error statistics
void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.module_errors.store(0, std::memory_order_relaxed);
    s_error_stats.command_errors.store(0, std::memory_order_relaxed);
    s_error_stats.id_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

/// Get error statistics as formatted string
std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Module: " << s_error_stats.module_errors.load() << "\n"
        << "  Command: " << s_error_stats.command_errors.load() << "\n"
        << "  Id: " << s_error_stats.id_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace rhost_core
