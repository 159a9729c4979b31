/// @file entity_creator_registry.cpp
/// @brief Entity creator index implementation

#include <rhost/scene/entity_creator_registry.hpp>

#include <rhost/core/log.hpp>

namespace rhost_scene {

void EntityCreatorRegistry::assign(const CreatorPtr& creator) {
    if (!creator) {
        return;
    }

    for (PCode code : creator->creation_capabilities()) {
        auto it = m_creators.find(code);
        if (it != m_creators.end() && it->second != creator) {
            rhost_core::modules_logger()->debug(
                "Entity creator for {} replaced by a newer registration", pcode_name(code));
        }
        m_creators[code] = creator;
    }
}

EntityCreatorRegistry::CreatorPtr EntityCreatorRegistry::creator_for(PCode code) const {
    auto it = m_creators.find(code);
    return it != m_creators.end() ? it->second : nullptr;
}

std::vector<PCode> EntityCreatorRegistry::codes() const {
    std::vector<PCode> result;
    result.reserve(m_creators.size());
    for (const auto& [code, creator] : m_creators) {
        result.push_back(code);
    }
    return result;
}

} // namespace rhost_scene
