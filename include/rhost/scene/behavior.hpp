#pragma once

/// @file behavior.hpp
/// @brief Pluggable simulation behaviour driven by a Scene

#include "fwd.hpp"
#include "types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace rhost_scene {

/// What a concrete simulation does on each lifecycle call.
///
/// The Scene owns one of these and forwards to it; without one the calls
/// are no-ops.
class ISceneBehavior {
public:
    virtual ~ISceneBehavior() = default;

    /// Advance the simulation by one frame
    virtual void update(Scene& scene) = 0;

    /// Load the region heightmap
    virtual void load_world_map(Scene& scene) = 0;

    /// A new client connected; it starts as a child agent
    virtual void add_new_client(Scene& scene, const std::shared_ptr<IClientAPI>& client) = 0;

    /// A client's agent left the region
    virtual void remove_client(Scene& scene, const std::string& agent_id) = 0;

    /// Drop every agent on a circuit
    virtual void close_all_agents(Scene& scene, std::uint32_t circuit_code) = 0;

    /// Whether a neighbouring region answered
    [[nodiscard]] virtual bool other_region_up(Scene& scene, const RegionInfo& other) = 0;

    /// Whether an avatar is a child agent here
    [[nodiscard]] virtual bool presence_child_status(const Scene& scene, const std::string& avatar_id) const {
        (void)scene;
        (void)avatar_id;
        return false;
    }
};

} // namespace rhost_scene
