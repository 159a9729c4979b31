#pragma once

/// @file report.hpp
/// @brief JSON diagnostics snapshot of a scene

#include "fwd.hpp"

#include <nlohmann/json.hpp>

namespace rhost_scene {

/// Describe a scene's region, modules, capabilities, entity creators,
/// commanders and id allocator state
[[nodiscard]] nlohmann::json scene_report(const Scene& scene);

} // namespace rhost_scene
