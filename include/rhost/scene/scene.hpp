#pragma once

/// @file scene.hpp
/// @brief Scene: registries, identifiers and lifecycle of one simulated region
///
/// A scene is assembled by a SceneBuilder during a single-threaded setup
/// phase. Modules are attached and capability interfaces registered on the
/// builder; build() hands everything to the Scene, after which the module
/// set and capability maps only change through close(). Command
/// registration, command lookup, id allocation and event delivery are safe
/// from any thread once the scene exists.

#include "fwd.hpp"
#include "behavior.hpp"
#include "client.hpp"
#include "command_registry.hpp"
#include "events.hpp"
#include "interface_registry.hpp"
#include "module_registry.hpp"
#include "types.hpp"

#include <rhost/core/error.hpp>
#include <rhost/core/id.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace rhost_scene {

// =============================================================================
// SceneBuilder
// =============================================================================

/// Single-writer setup phase for a Scene
class SceneBuilder {
public:
    explicit SceneBuilder(RegionInfo region,
                          rhost_core::LocalId local_id_seed = rhost_core::k_default_local_id_seed);

    // Non-copyable
    SceneBuilder(const SceneBuilder&) = delete;
    SceneBuilder& operator=(const SceneBuilder&) = delete;

    /// Attach a module under a name and call its initialise hook.
    /// A name that is already attached is silently ignored.
    /// @return true if the module was attached
    bool add_module(const std::string& name, std::shared_ptr<IRegionModule> module);

    /// Register the single implementer of a capability (first one wins)
    template<ModuleCapability T>
    bool register_module_interface(std::shared_ptr<T> instance) {
        return m_interfaces.register_module_interface<T>(std::move(instance));
    }

    /// Append an implementer to a capability (same instance only once)
    template<ModuleCapability T>
    bool stack_module_interface(std::shared_ptr<T> instance) {
        return m_interfaces.stack_module_interface<T>(std::move(instance));
    }

    /// Capabilities registered so far, for modules initialising after others
    [[nodiscard]] const InterfaceRegistry& interfaces() const noexcept { return m_interfaces; }

    [[nodiscard]] const ModuleRegistry& modules() const noexcept { return *m_modules; }

    [[nodiscard]] const RegionInfo& region_info() const noexcept { return m_region; }

    /// Set the simulation behaviour the scene forwards to
    SceneBuilder& with_behavior(std::unique_ptr<ISceneBehavior> behavior);

    /// Set the console command registrations are forwarded to
    SceneBuilder& with_console(std::shared_ptr<ICommandConsole> console);

    /// Produce the scene and run every module's post_initialise hook in
    /// attach order. The builder is left empty.
    [[nodiscard]] std::unique_ptr<Scene> build() &&;

private:
    RegionInfo m_region;
    rhost_core::LocalId m_local_id_seed;
    std::unique_ptr<ModuleRegistry> m_modules;
    InterfaceRegistry m_interfaces;
    std::unique_ptr<ISceneBehavior> m_behavior;
    std::shared_ptr<ICommandConsole> m_console;
};

// =============================================================================
// Scene
// =============================================================================

/// One simulated region
class Scene {
public:
    ~Scene();

    // Non-copyable, non-movable (modules hold references)
    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;
    Scene(Scene&&) = delete;
    Scene& operator=(Scene&&) = delete;

    // =========================================================================
    // Region
    // =========================================================================

    [[nodiscard]] const RegionInfo& region_info() const noexcept { return m_region; }

    [[nodiscard]] RegionStatus region_status() const noexcept {
        return m_status.load(std::memory_order_acquire);
    }

    void set_region_status(RegionStatus status) noexcept {
        m_status.store(status, std::memory_order_release);
    }

    /// Simulator name and version
    [[nodiscard]] std::string simulator_version() const;

    // =========================================================================
    // Modules and capabilities
    // =========================================================================

    [[nodiscard]] const ModuleRegistry& modules() const noexcept { return *m_modules; }

    [[nodiscard]] const InterfaceRegistry& interfaces() const noexcept { return m_interfaces; }

    /// First implementer of a capability, or nullptr
    template<ModuleCapability T>
    [[nodiscard]] std::shared_ptr<T> request_module_interface() const {
        return m_interfaces.request_module_interface<T>();
    }

    /// All implementers of a capability. Never empty: an unregistered
    /// capability yields one nullptr placeholder.
    template<ModuleCapability T>
    [[nodiscard]] std::vector<std::shared_ptr<T>> request_module_interfaces() const {
        return m_interfaces.request_module_interfaces<T>();
    }

    /// Module responsible for creating objects of a kind, or nullptr
    [[nodiscard]] std::shared_ptr<IEntityCreator> entity_creator(PCode code) const {
        return m_interfaces.entity_creators().creator_for(code);
    }

    // =========================================================================
    // Commands
    // =========================================================================

    /// Register a commander and publish its commands (see CommandRegistry)
    bool register_module_commander(const std::shared_ptr<Commander>& commander) {
        return m_commands.register_module_commander(commander);
    }

    [[nodiscard]] std::shared_ptr<Command> get_command(const std::string& name) const {
        return m_commands.get_command(name);
    }

    [[nodiscard]] std::shared_ptr<Commander> get_commander(const std::string& name) const {
        return m_commands.get_commander(name);
    }

    /// The live commander map (not a copy)
    [[nodiscard]] CommandRegistry::CommanderMap& get_commanders() noexcept {
        return m_commands.get_commanders();
    }

    [[nodiscard]] const CommandRegistry& commands() const noexcept { return m_commands; }

    /// Forward a command registration to the console.
    ///
    /// Without a console this is a no-op. A null owner registers the command
    /// with no module name. An owner that is not a region module is rejected
    /// with InvalidArgument.
    rhost_core::Result<void> add_command(const std::shared_ptr<ModuleInterface>& owner,
                                         const std::string& command,
                                         const std::string& short_help,
                                         const std::string& long_help,
                                         CommandCallback callback);

    // =========================================================================
    // Identifiers
    // =========================================================================

    /// Allocate a new local id (thread-safe, strictly increasing)
    [[nodiscard]] rhost_core::Result<rhost_core::LocalId> allocate_local_id() {
        return m_local_ids.allocate();
    }

    [[nodiscard]] const rhost_core::LocalIdAllocator& local_ids() const noexcept { return m_local_ids; }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    [[nodiscard]] SceneEvents& events() noexcept { return m_events; }

    /// Close every non-shared module, detach all modules and signal shutdown.
    /// Never throws; failures are logged.
    ModuleRegistry::CloseReport close();

    /// Ask restart observers to restart this region
    /// @return number of observers notified
    std::size_t restart(int seconds_until_restart);

    /// Diagnostic report. "modules" lists attached non-shared modules; any
    /// other topic reports nothing.
    /// @return the report lines that were logged
    std::vector<std::string> show(const std::vector<std::string>& params) const;

    // =========================================================================
    // Clients and simulation behaviour
    // =========================================================================

    [[nodiscard]] ClientManager& clients() noexcept { return m_clients; }
    [[nodiscard]] const ClientManager& clients() const noexcept { return m_clients; }

    /// Send the terrain heightmap to a client
    /// @return false if no terrain channel is registered
    bool send_layer_data(IClientAPI& client) const;

    void update();
    void load_world_map();
    void add_new_client(const std::shared_ptr<IClientAPI>& client);
    void remove_client(const std::string& agent_id);
    void close_all_agents(std::uint32_t circuit_code);
    [[nodiscard]] bool other_region_up(const RegionInfo& other);
    [[nodiscard]] bool presence_child_status(const std::string& avatar_id) const;

private:
    friend class SceneBuilder;

    Scene(RegionInfo region,
          rhost_core::LocalId local_id_seed,
          std::unique_ptr<ModuleRegistry> modules,
          InterfaceRegistry interfaces,
          std::unique_ptr<ISceneBehavior> behavior,
          std::shared_ptr<ICommandConsole> console);

    RegionInfo m_region;
    std::atomic<RegionStatus> m_status{RegionStatus::Starting};

    std::unique_ptr<ModuleRegistry> m_modules;
    InterfaceRegistry m_interfaces;
    CommandRegistry m_commands;
    rhost_core::LocalIdAllocator m_local_ids;
    SceneEvents m_events;
    ClientManager m_clients;

    std::unique_ptr<ISceneBehavior> m_behavior;
    std::shared_ptr<ICommandConsole> m_console;
};

} // namespace rhost_scene
