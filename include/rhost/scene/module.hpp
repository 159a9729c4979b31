#pragma once

/// @file module.hpp
/// @brief Region module contract and capability interface base

#include "fwd.hpp"
#include "types.hpp"

#include <rhost/core/error.hpp>

#include <concepts>
#include <string>
#include <type_traits>

namespace rhost_scene {

// =============================================================================
// ModuleInterface
// =============================================================================

/// Common base of every capability interface and of region modules.
///
/// Interfaces derive from it virtually so one object implementing several
/// capabilities has a single ModuleInterface subobject; that subobject's
/// address is the identity used for de-duplication.
class ModuleInterface {
public:
    virtual ~ModuleInterface() = default;
};

/// A capability interface: derives from ModuleInterface and names its tag
template<typename T>
concept ModuleCapability = std::is_base_of_v<ModuleInterface, T> && requires {
    { T::k_capability } -> std::convertible_to<Capability>;
};

// =============================================================================
// IRegionModule
// =============================================================================

/// A pluggable extension attached to a scene
class IRegionModule : public virtual ModuleInterface {
public:
    /// Unique module name
    [[nodiscard]] virtual std::string name() const = 0;

    /// Shared modules are closed by the host that owns them, not by the scene
    [[nodiscard]] virtual bool is_shared_module() const = 0;

    /// Called once when the module is first attached to a scene under setup.
    /// Register capability interfaces here.
    virtual void initialise(SceneBuilder& builder) {
        (void)builder;
    }

    /// Called once the scene has been built, in attach order
    virtual void post_initialise(Scene& scene) {
        (void)scene;
    }

    /// Tear the module down. May report failure or throw; the scene isolates both.
    virtual rhost_core::Result<void> close() = 0;
};

} // namespace rhost_scene
