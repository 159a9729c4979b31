#pragma once

/// @file entity_creator_registry.hpp
/// @brief Creation code to entity creator index

#include "capabilities.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <vector>

namespace rhost_scene {

/// Maps each creation code to the module that instantiates that kind of object.
///
/// Maintained by InterfaceRegistry: whenever an implementer that is also an
/// IEntityCreator is registered, it becomes the creator for every code it
/// supports, replacing any earlier creator for those codes.
class EntityCreatorRegistry {
public:
    using CreatorPtr = std::shared_ptr<IEntityCreator>;

    /// Point every code the creator supports at it
    void assign(const CreatorPtr& creator);

    /// Creator for a code, or nullptr
    [[nodiscard]] CreatorPtr creator_for(PCode code) const;

    [[nodiscard]] bool contains(PCode code) const {
        return m_creators.count(code) > 0;
    }

    /// Codes with a creator, ascending
    [[nodiscard]] std::vector<PCode> codes() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_creators.size(); }

    void clear() noexcept { m_creators.clear(); }

private:
    std::map<PCode, CreatorPtr> m_creators;
};

} // namespace rhost_scene
