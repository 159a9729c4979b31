/// @file report.cpp
/// @brief JSON diagnostics snapshot implementation

#include <rhost/scene/report.hpp>
#include <rhost/scene/scene.hpp>

namespace rhost_scene {

nlohmann::json scene_report(const Scene& scene) {
    nlohmann::json j;

    const auto& info = scene.region_info();
    j["region"] = {
        {"name", info.region_name},
        {"handle", info.region_handle},
        {"location", {info.location_x, info.location_y}},
        {"max_agents", info.max_agents},
        {"status", region_status_name(scene.region_status())},
    };

    nlohmann::json modules = nlohmann::json::array();
    for (const auto& [name, module] : scene.modules().snapshot()) {
        modules.push_back({
            {"name", name},
            {"shared", module->is_shared_module()},
        });
    }
    j["modules"] = modules;

    nlohmann::json capabilities = nlohmann::json::object();
    for (Capability cap : scene.interfaces().capabilities()) {
        capabilities[capability_name(cap)] = scene.interfaces().implementer_count(cap);
    }
    j["capabilities"] = capabilities;

    nlohmann::json creators = nlohmann::json::array();
    for (PCode code : scene.interfaces().entity_creators().codes()) {
        creators.push_back(pcode_name(code));
    }
    j["entity_creators"] = creators;

    nlohmann::json commanders = nlohmann::json::object();
    for (const auto& [name, commander] : scene.commands().commanders_snapshot()) {
        nlohmann::json commands = nlohmann::json::array();
        for (const auto& [command_name, command] : commander->commands()) {
            // Only commands this commander actually owns in the flat namespace
            if (scene.commands().owner_of(command_name) == name) {
                commands.push_back(command_name);
            }
        }
        commanders[name] = commands;
    }
    j["commanders"] = commanders;

    j["local_ids"] = {
        {"seed", scene.local_ids().seed()},
        {"last_allocated", scene.local_ids().last_allocated()},
        {"allocated", scene.local_ids().allocated_count()},
    };

    return j;
}

} // namespace rhost_scene
