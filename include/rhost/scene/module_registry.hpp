#pragma once

/// @file module_registry.hpp
/// @brief Registry of region modules attached to a scene

#include "module.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace rhost_scene {

// =============================================================================
// Module Registry
// =============================================================================

/// Attached region modules, keyed by name and kept in attach order
class ModuleRegistry {
public:
    using ModulePtr = std::shared_ptr<IRegionModule>;

    /// Outcome of closing every attached module
    struct CloseReport {
        std::size_t closed = 0;   ///< Close hooks invoked (successful or not)
        std::size_t failed = 0;   ///< Close hooks that reported or raised a failure
        std::size_t skipped = 0;  ///< Shared modules left to their owning host
    };

    ModuleRegistry() = default;

    // Non-copyable
    ModuleRegistry(const ModuleRegistry&) = delete;
    ModuleRegistry& operator=(const ModuleRegistry&) = delete;

    /// Attach a module under a name.
    /// If the name is already attached the call is ignored: the existing
    /// module is kept and nothing is replaced.
    /// @return true if the module was attached
    bool add_module(const std::string& name, ModulePtr module);

    /// Module attached under a name, or nullptr
    [[nodiscard]] ModulePtr get(const std::string& name) const;

    /// Check if a name is attached
    [[nodiscard]] bool contains(const std::string& name) const;

    /// Attached module count
    [[nodiscard]] std::size_t count() const;

    [[nodiscard]] bool empty() const;

    /// Names in attach order
    [[nodiscard]] std::vector<std::string> names() const;

    /// Snapshot of (name, module) pairs in attach order
    [[nodiscard]] std::vector<std::pair<std::string, ModulePtr>> snapshot() const;

    /// Names of modules this scene is responsible for closing, in attach order
    [[nodiscard]] std::vector<std::string> non_shared_names() const;

    /// Close every non-shared module, then detach all modules.
    ///
    /// A failing close hook (error result or any exception) is logged and
    /// recorded; the remaining modules are still closed and the registry is
    /// always left empty.
    CloseReport close_all();

private:
    mutable std::mutex m_mutex;
    std::map<std::string, ModulePtr> m_modules;
    std::vector<std::string> m_order;
};

} // namespace rhost_scene
