/// @file scene.cpp
/// @brief Scene and SceneBuilder implementation

#include <rhost/scene/scene.hpp>

#include <rhost/core/core.hpp>
#include <rhost/core/log.hpp>

#include <exception>
#include <utility>

namespace rhost_scene {

// =============================================================================
// SceneBuilder
// =============================================================================

SceneBuilder::SceneBuilder(RegionInfo region, rhost_core::LocalId local_id_seed)
    : m_region(std::move(region))
    , m_local_id_seed(local_id_seed)
    , m_modules(std::make_unique<ModuleRegistry>())
{
}

bool SceneBuilder::add_module(const std::string& name, std::shared_ptr<IRegionModule> module) {
    if (!module) {
        rhost_core::modules_logger()->warn("Ignoring null module '{}'", name);
        return false;
    }

    if (!m_modules->add_module(name, module)) {
        return false;
    }

    module->initialise(*this);
    return true;
}

SceneBuilder& SceneBuilder::with_behavior(std::unique_ptr<ISceneBehavior> behavior) {
    m_behavior = std::move(behavior);
    return *this;
}

SceneBuilder& SceneBuilder::with_console(std::shared_ptr<ICommandConsole> console) {
    m_console = std::move(console);
    return *this;
}

std::unique_ptr<Scene> SceneBuilder::build() && {
    std::unique_ptr<Scene> scene(new Scene(
        std::move(m_region),
        m_local_id_seed,
        std::move(m_modules),
        std::move(m_interfaces),
        std::move(m_behavior),
        std::move(m_console)));

    m_modules = std::make_unique<ModuleRegistry>();

    for (const auto& [name, module] : scene->modules().snapshot()) {
        module->post_initialise(*scene);
    }

    scene->set_region_status(RegionStatus::Up);
    rhost_core::scene_logger()->info("Region '{}' up with {} module(s)",
        scene->region_info().region_name, scene->modules().count());
    return scene;
}

// =============================================================================
// Scene
// =============================================================================

Scene::Scene(RegionInfo region,
             rhost_core::LocalId local_id_seed,
             std::unique_ptr<ModuleRegistry> modules,
             InterfaceRegistry interfaces,
             std::unique_ptr<ISceneBehavior> behavior,
             std::shared_ptr<ICommandConsole> console)
    : m_region(std::move(region))
    , m_modules(std::move(modules))
    , m_interfaces(std::move(interfaces))
    , m_local_ids(local_id_seed)
    , m_behavior(std::move(behavior))
    , m_console(std::move(console))
{
}

Scene::~Scene() = default;

std::string Scene::simulator_version() const {
    return "rhost region host " + std::string(rhost_core::RHOST_VERSION);
}

// =============================================================================
// Commands
// =============================================================================

rhost_core::Result<void> Scene::add_command(const std::shared_ptr<ModuleInterface>& owner,
                                            const std::string& command,
                                            const std::string& short_help,
                                            const std::string& long_help,
                                            CommandCallback callback) {
    if (!m_console) {
        return rhost_core::Ok();
    }

    std::string module_name;
    bool shared = false;

    if (owner) {
        auto module = std::dynamic_pointer_cast<IRegionModule>(owner);
        if (!module) {
            rhost_core::Error err = rhost_core::ModuleError::not_a_region_module("add_command");
            err.with_context("command", command);
            rhost_core::debug::record_error(err);
            return rhost_core::Err(std::move(err));
        }
        module_name = module->name();
        shared = module->is_shared_module();
    }

    m_console->add_command(module_name, shared, command, short_help, long_help, std::move(callback));
    return rhost_core::Ok();
}

// =============================================================================
// Lifecycle
// =============================================================================

ModuleRegistry::CloseReport Scene::close() {
    RHOST_LOG_SCOPE("Scene::close", "scene");
    auto logger = rhost_core::scene_logger();

    auto report = m_modules->close_all();
    if (report.failed > 0) {
        logger->error("{} of {} module(s) failed to close in region '{}'",
            report.failed, report.closed, m_region.region_name);
    }

    try {
        m_events.trigger_shutdown();
    } catch (const std::exception& e) {
        rhost_core::Error err(rhost_core::ErrorCode::InvalidState,
            std::string("Shutdown notification failed: ") + e.what());
        rhost_core::debug::record_error(err);
        logger->error("Scene close failed with exception {}", e.what());
    } catch (...) {
        rhost_core::Error err(rhost_core::ErrorCode::InvalidState,
            "Shutdown notification failed: unknown exception");
        rhost_core::debug::record_error(err);
        logger->error("Scene close failed with unknown exception");
    }

    set_region_status(RegionStatus::Down);
    return report;
}

std::size_t Scene::restart(int seconds_until_restart) {
    rhost_core::scene_logger()->warn(
        "Region '{}' restart requested in {}s, passing restart message up",
        m_region.region_name, seconds_until_restart);
    return m_events.trigger_restart(m_region);
}

std::vector<std::string> Scene::show(const std::vector<std::string>& params) const {
    std::vector<std::string> lines;
    if (params.empty()) {
        return lines;
    }

    auto logger = rhost_core::scene_logger();
    const std::string& topic = params.front();

    if (topic == "modules") {
        lines.push_back("The currently loaded modules in " + m_region.region_name + " are:");
        for (const auto& name : m_modules->non_shared_names()) {
            lines.push_back("Region Module: " + name);
        }
        for (const auto& line : lines) {
            logger->info("{}", line);
        }
    } else {
        logger->debug("Nothing to show for topic '{}'", topic);
    }

    return lines;
}

// =============================================================================
// Clients and simulation behaviour
// =============================================================================

bool Scene::send_layer_data(IClientAPI& client) const {
    auto terrain = request_module_interface<ITerrainChannel>();
    if (!terrain) {
        rhost_core::scene_logger()->warn(
            "No terrain channel in region '{}', layer data not sent to circuit {}",
            m_region.region_name, client.circuit_code());
        return false;
    }

    client.send_layer_data(terrain->get_floats_serialised());
    return true;
}

void Scene::update() {
    if (m_behavior) {
        m_behavior->update(*this);
    }
}

void Scene::load_world_map() {
    if (m_behavior) {
        m_behavior->load_world_map(*this);
    }
}

void Scene::add_new_client(const std::shared_ptr<IClientAPI>& client) {
    if (m_behavior) {
        m_behavior->add_new_client(*this, client);
    }
}

void Scene::remove_client(const std::string& agent_id) {
    if (m_behavior) {
        m_behavior->remove_client(*this, agent_id);
    }
}

void Scene::close_all_agents(std::uint32_t circuit_code) {
    if (m_behavior) {
        m_behavior->close_all_agents(*this, circuit_code);
    }
}

bool Scene::other_region_up(const RegionInfo& other) {
    return m_behavior ? m_behavior->other_region_up(*this, other) : false;
}

bool Scene::presence_child_status(const std::string& avatar_id) const {
    return m_behavior ? m_behavior->presence_child_status(*this, avatar_id) : false;
}

} // namespace rhost_scene
