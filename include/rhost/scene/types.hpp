#pragma once

/// @file types.hpp
/// @brief Region metadata and shared enumerations for rhost_scene

#include "fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace rhost_scene {

// =============================================================================
// RegionInfo
// =============================================================================

/// Size of a region edge in metres; grid coordinates are scaled by this
inline constexpr std::uint32_t k_region_size = 256;

/// Static description of the region a scene simulates
struct RegionInfo {
    std::string region_name;
    std::uint32_t location_x = 1000;
    std::uint32_t location_y = 1000;
    std::uint64_t region_handle = 0;
    std::uint32_t max_agents = 100;

    /// Derive the region handle from grid coordinates
    [[nodiscard]] static constexpr std::uint64_t handle_for(std::uint32_t x, std::uint32_t y) noexcept {
        return (static_cast<std::uint64_t>(x * k_region_size) << 32) |
               static_cast<std::uint64_t>(y * k_region_size);
    }

    /// Create region info with a handle derived from its location
    [[nodiscard]] static RegionInfo create(std::string name, std::uint32_t x, std::uint32_t y) {
        RegionInfo info;
        info.region_name = std::move(name);
        info.location_x = x;
        info.location_y = y;
        info.region_handle = handle_for(x, y);
        return info;
    }
};

// =============================================================================
// RegionStatus
// =============================================================================

/// Operational status of a region
enum class RegionStatus : std::uint8_t {
    Down,
    Up,
    Crashed,
    Starting,
    SlaveScene,
};

/// Get region status name
[[nodiscard]] inline const char* region_status_name(RegionStatus status) {
    switch (status) {
        case RegionStatus::Down: return "Down";
        case RegionStatus::Up: return "Up";
        case RegionStatus::Crashed: return "Crashed";
        case RegionStatus::Starting: return "Starting";
        case RegionStatus::SlaveScene: return "SlaveScene";
        default: return "Unknown";
    }
}

// =============================================================================
// PCode
// =============================================================================

/// Creation code: which kind of simulated object a creator instantiates
enum class PCode : std::uint8_t {
    None = 0,
    Primitive = 9,
    Avatar = 47,
    Grass = 95,
    NewTree = 111,
    ParticleSystem = 143,
    Tree = 255,
};

/// Get creation code name
[[nodiscard]] inline const char* pcode_name(PCode code) {
    switch (code) {
        case PCode::None: return "None";
        case PCode::Primitive: return "Primitive";
        case PCode::Avatar: return "Avatar";
        case PCode::Grass: return "Grass";
        case PCode::NewTree: return "NewTree";
        case PCode::ParticleSystem: return "ParticleSystem";
        case PCode::Tree: return "Tree";
        default: return "Unknown";
    }
}

// =============================================================================
// Capability
// =============================================================================

/// Closed set of capability tags modules can register implementations for
enum class Capability : std::uint8_t {
    EntityCreator,
    TerrainChannel,
    Dialog,
    Chat,
    Sound,
};

/// Number of capability tags
inline constexpr std::size_t k_capability_count = 5;

/// Get capability name
[[nodiscard]] inline const char* capability_name(Capability cap) {
    switch (cap) {
        case Capability::EntityCreator: return "EntityCreator";
        case Capability::TerrainChannel: return "TerrainChannel";
        case Capability::Dialog: return "Dialog";
        case Capability::Chat: return "Chat";
        case Capability::Sound: return "Sound";
        default: return "Unknown";
    }
}

/// Capability for a dense index in [0, k_capability_count)
[[nodiscard]] inline std::optional<Capability> capability_from_index(std::size_t index) {
    if (index >= k_capability_count) {
        return std::nullopt;
    }
    return static_cast<Capability>(index);
}

} // namespace rhost_scene
