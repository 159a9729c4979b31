#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for rhost_scene

#include <cstdint>

namespace rhost_scene {

// Region metadata
struct RegionInfo;
enum class RegionStatus : std::uint8_t;
enum class PCode : std::uint8_t;
enum class Capability : std::uint8_t;

// Modules and capabilities
class ModuleInterface;
class IRegionModule;
class IEntityCreator;
class ITerrainChannel;
class IDialogModule;
class IChatModule;
class ISoundModule;

// Registries
class ModuleRegistry;
class InterfaceRegistry;
class EntityCreatorRegistry;
class Command;
class Commander;
class CommandRegistry;
class ICommandConsole;

// Clients
class IClientAPI;
class ClientManager;

// Lifecycle
struct SubscriptionId;
class SceneEvents;
class ISceneBehavior;
class SceneBuilder;
class Scene;

// Configuration
struct RegionConfig;
class RegionConfigParser;

} // namespace rhost_scene
