#pragma once

/// @file error.hpp
/// @brief Error handling types for rhost_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace rhost_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    Exhausted,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::Exhausted: return "Exhausted";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Region module errors
struct ModuleError {
    enum class Kind : std::uint8_t {
        NotFound,           // No module attached under that name
        AlreadyAttached,    // Module name already attached
        NotARegionModule,   // Handle does not satisfy the region module contract
        CloseFailed,        // Module close hook reported a failure
    };

    Kind kind;
    std::string message;
    std::string module_name;
    std::string reason;  // For CloseFailed

    [[nodiscard]] static ModuleError not_found(const std::string& name) {
        return ModuleError{Kind::NotFound, "Module not found: " + name, name, {}};
    }

    [[nodiscard]] static ModuleError already_attached(const std::string& name) {
        return ModuleError{Kind::AlreadyAttached, "Module already attached: " + name, name, {}};
    }

    [[nodiscard]] static ModuleError not_a_region_module(const std::string& context) {
        return ModuleError{Kind::NotARegionModule,
            context + ": module parameter must be a region module", {}, {}};
    }

    [[nodiscard]] static ModuleError close_failed(const std::string& name, const std::string& why) {
        return ModuleError{Kind::CloseFailed, "Module '" + name + "' failed to close: " + why, name, why};
    }
};

/// Command registry errors
struct CommandError {
    enum class Kind : std::uint8_t {
        NotFound,           // No command with that name
        DuplicateCommand,   // Command name owned by another commander
        DuplicateCommander, // Commander name already registered
    };

    Kind kind;
    std::string message;
    std::string command;
    std::string commander;
    std::string owner;  // Existing owner for duplicates

    [[nodiscard]] static CommandError not_found(const std::string& cmd) {
        return CommandError{Kind::NotFound, "Command not found: " + cmd, cmd, {}, {}};
    }

    [[nodiscard]] static CommandError duplicate_command(
        const std::string& cmd, const std::string& commander_name, const std::string& existing_owner) {
        return CommandError{Kind::DuplicateCommand,
            "Module commander " + commander_name + " tried to register the command " + cmd +
            " which has already been registered by " + existing_owner,
            cmd, commander_name, existing_owner};
    }

    [[nodiscard]] static CommandError duplicate_commander(const std::string& commander_name) {
        return CommandError{Kind::DuplicateCommander,
            "Module commander already registered: " + commander_name, {}, commander_name, {}};
    }
};

/// Local id allocation errors
struct IdError {
    enum class Kind : std::uint8_t {
        Exhausted,  // Counter reached the top of its range
    };

    Kind kind;
    std::string message;
    std::uint32_t last_allocated = 0;

    [[nodiscard]] static IdError exhausted(std::uint32_t last) {
        return IdError{Kind::Exhausted,
            "Local id space exhausted after " + std::to_string(last), last};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        Io,       // File could not be read
        Parse,    // Document is not valid TOML
        Invalid,  // Document is valid but a value is rejected
    };

    Kind kind;
    std::string message;
    std::string source;
    std::string key;  // For Invalid

    [[nodiscard]] static ConfigError io(const std::string& path) {
        return ConfigError{Kind::Io, "Failed to open config file: " + path, path, {}};
    }

    [[nodiscard]] static ConfigError parse(const std::string& source_name, const std::string& what) {
        return ConfigError{Kind::Parse, "TOML parse error: " + what, source_name, {}};
    }

    [[nodiscard]] static ConfigError invalid(
        const std::string& source_name, const std::string& key_name, const std::string& why) {
        return ConfigError{Kind::Invalid, "Invalid value for '" + key_name + "': " + why, source_name, key_name};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ModuleError,
        CommandError,
        IdError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ModuleError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(CommandError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(IdError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context pairs, ordered by key
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(ModuleError::Kind kind) {
        switch (kind) {
            case ModuleError::Kind::NotFound: return ErrorCode::NotFound;
            case ModuleError::Kind::AlreadyAttached: return ErrorCode::AlreadyExists;
            case ModuleError::Kind::NotARegionModule: return ErrorCode::InvalidArgument;
            case ModuleError::Kind::CloseFailed: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(CommandError::Kind kind) {
        switch (kind) {
            case CommandError::Kind::NotFound: return ErrorCode::NotFound;
            case CommandError::Kind::DuplicateCommand: return ErrorCode::AlreadyExists;
            case CommandError::Kind::DuplicateCommander: return ErrorCode::AlreadyExists;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(IdError::Kind kind) {
        switch (kind) {
            case IdError::Kind::Exhausted: return ErrorCode::Exhausted;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::Io: return ErrorCode::IOError;
            case ConfigError::Kind::Parse: return ErrorCode::ParseError;
            case ConfigError::Kind::Invalid: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count of recorded errors of one payload kind
std::uint64_t module_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace rhost_core
