#pragma once

/// @file region.hpp
/// @brief Main include file for rhost_scene module

#include "fwd.hpp"
#include "types.hpp"
#include "module.hpp"
#include "capabilities.hpp"
#include "module_registry.hpp"
#include "entity_creator_registry.hpp"
#include "interface_registry.hpp"
#include "command_registry.hpp"
#include "events.hpp"
#include "client.hpp"
#include "behavior.hpp"
#include "config.hpp"
#include "scene.hpp"
#include "report.hpp"

/// @namespace rhost_scene
/// @brief Region scene: module attachment, capability lookup, commands and lifecycle
///
/// Example usage:
/// @code
/// #include <rhost/scene/region.hpp>
///
/// using namespace rhost_scene;
///
/// class TerrainModule : public IRegionModule,
///                       public ITerrainChannel,
///                       public std::enable_shared_from_this<TerrainModule> {
/// public:
///     std::string name() const override { return "terrain"; }
///     bool is_shared_module() const override { return false; }
///
///     void initialise(SceneBuilder& builder) override {
///         builder.register_module_interface<ITerrainChannel>(shared_from_this());
///     }
///     ...
/// };
///
/// SceneBuilder builder(RegionInfo::create("Sandbox", 1000, 1000));
/// builder.add_module("terrain", std::make_shared<TerrainModule>());
/// auto scene = std::move(builder).build();
///
/// auto terrain = scene->request_module_interface<ITerrainChannel>();
/// auto id = scene->allocate_local_id();
/// scene->close();
/// @endcode
