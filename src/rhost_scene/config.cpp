/// @file config.cpp
/// @brief Region configuration (region.toml) parsing implementation

#include <rhost/scene/config.hpp>

#include <toml++/toml.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

namespace rhost_scene {

namespace {

/// Read an optional non-negative integer that must fit in 32 bits
std::optional<std::string> read_u32(const toml::table& tbl, const char* key,
                                    std::uint32_t& out) {
    auto node = tbl[key];
    if (!node) {
        return std::nullopt;
    }
    auto value = node.value<std::int64_t>();
    if (!value) {
        return std::string("expected an integer");
    }
    if (*value < 0 || *value > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
        return std::string("out of range");
    }
    out = static_cast<std::uint32_t>(*value);
    return std::nullopt;
}

} // anonymous namespace

rhost_core::Result<RegionConfig> RegionConfigParser::parse(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return fail(rhost_core::ConfigError::io(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_string(buffer.str(), path.string());
}

rhost_core::Result<RegionConfig> RegionConfigParser::parse_string(
    const std::string& content,
    const std::string& source_name)
{
    using rhost_core::ConfigError;

    RegionConfig config;
    toml::table tbl;

    try {
        tbl = toml::parse(content, source_name);
    } catch (const toml::parse_error& err) {
        return fail(ConfigError::parse(source_name, std::string(err.description())));
    }

    // [region]
    auto region = tbl["region"].as_table();
    if (!region) {
        return fail(ConfigError::invalid(source_name, "region", "missing [region] table"));
    }

    auto name = (*region)["name"].value<std::string>();
    if (!name || name->empty()) {
        return fail(ConfigError::invalid(source_name, "region.name", "a non-empty name is required"));
    }
    config.region.region_name = *name;

    if (auto why = read_u32(*region, "location_x", config.region.location_x)) {
        return fail(ConfigError::invalid(source_name, "region.location_x", *why));
    }
    if (auto why = read_u32(*region, "location_y", config.region.location_y)) {
        return fail(ConfigError::invalid(source_name, "region.location_y", *why));
    }
    if (auto why = read_u32(*region, "max_agents", config.region.max_agents)) {
        return fail(ConfigError::invalid(source_name, "region.max_agents", *why));
    }

    if (auto handle = (*region)["handle"]) {
        auto value = handle.value<std::int64_t>();
        if (!value || *value < 0) {
            return fail(ConfigError::invalid(source_name, "region.handle", "expected a non-negative integer"));
        }
        config.region.region_handle = static_cast<std::uint64_t>(*value);
    } else {
        config.region.region_handle = RegionInfo::handle_for(config.region.location_x, config.region.location_y);
    }

    // [scene]
    if (auto scene = tbl["scene"].as_table()) {
        if (auto why = read_u32(*scene, "local_id_seed", config.local_id_seed)) {
            return fail(ConfigError::invalid(source_name, "scene.local_id_seed", *why));
        }
    }

    // [logging]
    if (auto logging = tbl["logging"].as_table()) {
        if (auto level = (*logging)["level"].value<std::string>()) {
            auto parsed = rhost_core::parse_log_level(*level);
            if (!parsed) {
                return fail(ConfigError::invalid(source_name, "logging.level", "unknown level '" + *level + "'"));
            }
            config.logging.level = *parsed;
        }
        if (auto console = (*logging)["console"].value<bool>()) {
            config.logging.console_enabled = *console;
        }
        if (auto file = (*logging)["file"].value<bool>()) {
            config.logging.file_enabled = *file;
        }
        if (auto directory = (*logging)["directory"].value<std::string>()) {
            config.logging.log_directory = *directory;
        }
        if (auto max_size = (*logging)["max_file_size"].value<std::int64_t>()) {
            if (*max_size <= 0) {
                return fail(ConfigError::invalid(source_name, "logging.max_file_size", "must be positive"));
            }
            config.logging.max_file_size = static_cast<std::size_t>(*max_size);
        }
        if (auto max_files = (*logging)["max_files"].value<std::int64_t>()) {
            if (*max_files <= 0) {
                return fail(ConfigError::invalid(source_name, "logging.max_files", "must be positive"));
            }
            config.logging.max_files = static_cast<std::size_t>(*max_files);
        }
    }

    m_last_error.clear();
    return config;
}

rhost_core::Result<RegionConfig> RegionConfigParser::fail(rhost_core::ConfigError err) {
    m_last_error = err.message;
    return rhost_core::Err<RegionConfig>(rhost_core::Error(std::move(err)));
}

} // namespace rhost_scene
