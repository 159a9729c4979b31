#pragma once

/// @file capabilities.hpp
/// @brief Capability interfaces modules can register with a scene

#include "module.hpp"

#include <string>
#include <vector>

namespace rhost_scene {

/// Instantiates simulated objects for a set of creation codes
class IEntityCreator : public virtual ModuleInterface {
public:
    static constexpr Capability k_capability = Capability::EntityCreator;

    /// Creation codes this module is responsible for
    [[nodiscard]] virtual std::vector<PCode> creation_capabilities() const = 0;
};

/// Region heightmap
class ITerrainChannel : public virtual ModuleInterface {
public:
    static constexpr Capability k_capability = Capability::TerrainChannel;

    [[nodiscard]] virtual int width() const = 0;
    [[nodiscard]] virtual int height() const = 0;

    /// Heightmap as a flat row-major array, as sent to clients
    [[nodiscard]] virtual std::vector<float> get_floats_serialised() const = 0;
};

/// Modal alerts and dialogs shown to agents
class IDialogModule : public virtual ModuleInterface {
public:
    static constexpr Capability k_capability = Capability::Dialog;

    virtual void send_general_alert(const std::string& message) = 0;
};

/// Local chat delivery
class IChatModule : public virtual ModuleInterface {
public:
    static constexpr Capability k_capability = Capability::Chat;

    virtual void deliver(int channel, const std::string& from, const std::string& message) = 0;
};

/// Positional sound triggers
class ISoundModule : public virtual ModuleInterface {
public:
    static constexpr Capability k_capability = Capability::Sound;

    virtual void trigger_sound(const std::string& sound_id, float gain) = 0;
};

} // namespace rhost_scene
