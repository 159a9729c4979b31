#pragma once

/// @file core.hpp
/// @brief Main include file for rhost_core module
///
/// This header includes all rhost_core components in dependency order.

#include "fwd.hpp"

#include "error.hpp"
#include "id.hpp"
#include "log.hpp"

/// @namespace rhost_core
/// @brief Foundation types shared by the region host
///
/// - **Error Handling**: Result<T> error propagation with typed payloads
/// - **Identifiers**: Concurrency-safe local id allocation
/// - **Logging**: Named spdlog loggers per subsystem

namespace rhost_core {

/// Library version string
inline constexpr const char* RHOST_VERSION = "0.3.0";

/// Get library version string
[[nodiscard]] inline std::string rhost_version_string() {
    return std::string("rhost ") + RHOST_VERSION;
}

} // namespace rhost_core
