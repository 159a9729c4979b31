#pragma once

/// @file config.hpp
/// @brief Region configuration (region.toml) parsing

#include "types.hpp"

#include <rhost/core/error.hpp>
#include <rhost/core/id.hpp>
#include <rhost/core/log.hpp>

#include <filesystem>
#include <string>

namespace rhost_scene {

/// Everything needed to bring a region scene up
struct RegionConfig {
    RegionInfo region;
    rhost_core::LocalId local_id_seed = rhost_core::k_default_local_id_seed;
    rhost_core::LogConfig logging;
};

/// Parser for region.toml files.
///
/// Example:
/// @code
/// [region]
/// name = "Sandbox"
/// location_x = 1000
/// location_y = 1000
///
/// [scene]
/// local_id_seed = 720000
///
/// [logging]
/// level = "info"
/// @endcode
class RegionConfigParser {
public:
    RegionConfigParser() = default;

    /// Parse a region config file
    [[nodiscard]] rhost_core::Result<RegionConfig> parse(const std::filesystem::path& path);

    /// Parse region config from a string
    [[nodiscard]] rhost_core::Result<RegionConfig> parse_string(
        const std::string& content,
        const std::string& source_name = "<string>");

    /// Message of the last failed parse (empty after a success)
    [[nodiscard]] const std::string& last_error() const noexcept { return m_last_error; }

private:
    rhost_core::Result<RegionConfig> fail(rhost_core::ConfigError err);

    std::string m_last_error;
};

} // namespace rhost_scene
