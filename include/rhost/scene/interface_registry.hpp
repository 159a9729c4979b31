#pragma once

/// @file interface_registry.hpp
/// @brief Capability registry: capability tag to ordered implementer list

#include "capabilities.hpp"
#include "entity_creator_registry.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace rhost_scene {

// =============================================================================
// Interface Registry
// =============================================================================

/// Maps each capability tag to the modules implementing it.
///
/// Index 0 of a tag's list is the answer to single-implementer requests.
/// An implementer appears at most once per tag. Not synchronised: it is
/// written only by SceneBuilder and read-only once the Scene exists.
class InterfaceRegistry {
public:
    using HandlePtr = std::shared_ptr<ModuleInterface>;

    InterfaceRegistry() = default;

    // Non-copyable, movable (handed from builder to scene)
    InterfaceRegistry(const InterfaceRegistry&) = delete;
    InterfaceRegistry& operator=(const InterfaceRegistry&) = delete;
    InterfaceRegistry(InterfaceRegistry&&) = default;
    InterfaceRegistry& operator=(InterfaceRegistry&&) = default;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Register the implementer of a capability.
    /// If the capability already has an implementer this is a no-op: the
    /// first registrant stays and the new instance is dropped.
    /// @return true if the instance was registered
    template<ModuleCapability T>
    bool register_module_interface(std::shared_ptr<T> instance) {
        HandlePtr handle = std::move(instance);
        return register_single(T::k_capability, std::move(handle));
    }

    /// Append an implementer to a capability's list unless that same
    /// instance is already in it.
    /// @return true if the instance was appended
    template<ModuleCapability T>
    bool stack_module_interface(std::shared_ptr<T> instance) {
        HandlePtr handle = std::move(instance);
        return register_stacked(T::k_capability, std::move(handle));
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// First implementer of a capability, or nullptr when none is registered
    template<ModuleCapability T>
    [[nodiscard]] std::shared_ptr<T> request_module_interface() const {
        return std::dynamic_pointer_cast<T>(first(T::k_capability));
    }

    /// All implementers of a capability, in registration order.
    ///
    /// When the capability has never been registered the result holds a
    /// single nullptr placeholder rather than being empty. Callers iterating
    /// the result must skip null entries.
    template<ModuleCapability T>
    [[nodiscard]] std::vector<std::shared_ptr<T>> request_module_interfaces() const {
        const auto* list = find(T::k_capability);
        if (!list) {
            return std::vector<std::shared_ptr<T>>(1);
        }

        std::vector<std::shared_ptr<T>> result;
        result.reserve(list->size());
        for (const auto& handle : *list) {
            result.push_back(std::dynamic_pointer_cast<T>(handle));
        }
        return result;
    }

    /// Number of implementers for a tag (0 if none)
    [[nodiscard]] std::size_t implementer_count(Capability cap) const;

    /// Check if a tag has an implementer list
    [[nodiscard]] bool contains(Capability cap) const {
        return m_bindings.count(cap) > 0;
    }

    /// Tags with at least one implementer, in tag order
    [[nodiscard]] std::vector<Capability> capabilities() const;

    /// Creation code index derived from registered entity creators
    [[nodiscard]] const EntityCreatorRegistry& entity_creators() const noexcept {
        return m_entity_creators;
    }

    /// Drop every binding and the derived creator index
    void clear();

private:
    bool register_single(Capability cap, HandlePtr handle);
    bool register_stacked(Capability cap, HandlePtr handle);
    void index_entity_creator(const HandlePtr& handle);

    [[nodiscard]] HandlePtr first(Capability cap) const;
    [[nodiscard]] const std::vector<HandlePtr>* find(Capability cap) const;

    std::map<Capability, std::vector<HandlePtr>> m_bindings;
    EntityCreatorRegistry m_entity_creators;
};

} // namespace rhost_scene
