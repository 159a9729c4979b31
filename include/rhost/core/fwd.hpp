#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for rhost_core module

#include <cstdint>

namespace rhost_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ModuleError;
struct CommandError;
struct IdError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// ID Types
// =============================================================================

using LocalId = std::uint32_t;
class LocalIdAllocator;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace rhost_core
