/// @file interface_registry.cpp
/// @brief Capability registry implementation

#include <rhost/scene/interface_registry.hpp>

#include <rhost/core/log.hpp>

#include <algorithm>

namespace rhost_scene {

// =============================================================================
// Registration
// =============================================================================

bool InterfaceRegistry::register_single(Capability cap, HandlePtr handle) {
    if (!handle) {
        rhost_core::modules_logger()->warn("Ignoring null {} implementer", capability_name(cap));
        return false;
    }

    if (m_bindings.count(cap)) {
        rhost_core::modules_logger()->debug(
            "{} already has an implementer, keeping the first registration", capability_name(cap));
        return false;
    }

    m_bindings[cap].push_back(handle);
    index_entity_creator(handle);
    return true;
}

bool InterfaceRegistry::register_stacked(Capability cap, HandlePtr handle) {
    if (!handle) {
        rhost_core::modules_logger()->warn("Ignoring null {} implementer", capability_name(cap));
        return false;
    }

    auto& list = m_bindings[cap];
    if (std::find(list.begin(), list.end(), handle) != list.end()) {
        return false;
    }

    list.push_back(handle);
    index_entity_creator(handle);
    return true;
}

void InterfaceRegistry::index_entity_creator(const HandlePtr& handle) {
    if (auto creator = std::dynamic_pointer_cast<IEntityCreator>(handle)) {
        m_entity_creators.assign(creator);
    }
}

// =============================================================================
// Queries
// =============================================================================

InterfaceRegistry::HandlePtr InterfaceRegistry::first(Capability cap) const {
    const auto* list = find(cap);
    if (!list || list->empty()) {
        return nullptr;
    }
    return list->front();
}

const std::vector<InterfaceRegistry::HandlePtr>* InterfaceRegistry::find(Capability cap) const {
    auto it = m_bindings.find(cap);
    return it != m_bindings.end() ? &it->second : nullptr;
}

std::size_t InterfaceRegistry::implementer_count(Capability cap) const {
    const auto* list = find(cap);
    return list ? list->size() : 0;
}

std::vector<Capability> InterfaceRegistry::capabilities() const {
    std::vector<Capability> result;
    result.reserve(m_bindings.size());
    for (const auto& [cap, list] : m_bindings) {
        if (!list.empty()) {
            result.push_back(cap);
        }
    }
    return result;
}

void InterfaceRegistry::clear() {
    m_bindings.clear();
    m_entity_creators.clear();
}

} // namespace rhost_scene
