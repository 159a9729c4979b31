/// @file module_registry.cpp
/// @brief Region module registry implementation

#include <rhost/scene/module_registry.hpp>

#include <rhost/core/log.hpp>

#include <exception>
#include <utility>

namespace rhost_scene {

// =============================================================================
// Registration
// =============================================================================

bool ModuleRegistry::add_module(const std::string& name, ModulePtr module) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_modules.count(name)) {
        rhost_core::modules_logger()->debug("Module '{}' already attached, ignoring", name);
        return false;
    }

    m_modules.emplace(name, std::move(module));
    m_order.push_back(name);
    return true;
}

// =============================================================================
// Access
// =============================================================================

ModuleRegistry::ModulePtr ModuleRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_modules.find(name);
    return it != m_modules.end() ? it->second : nullptr;
}

bool ModuleRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_modules.count(name) > 0;
}

std::size_t ModuleRegistry::count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_modules.size();
}

bool ModuleRegistry::empty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_modules.empty();
}

std::vector<std::string> ModuleRegistry::names() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_order;
}

std::vector<std::pair<std::string, ModuleRegistry::ModulePtr>> ModuleRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::pair<std::string, ModulePtr>> result;
    result.reserve(m_order.size());
    for (const auto& name : m_order) {
        result.emplace_back(name, m_modules.at(name));
    }
    return result;
}

std::vector<std::string> ModuleRegistry::non_shared_names() const {
    std::vector<std::string> result;
    for (const auto& [name, module] : snapshot()) {
        if (module && !module->is_shared_module()) {
            result.push_back(name);
        }
    }
    return result;
}

// =============================================================================
// Shutdown
// =============================================================================

ModuleRegistry::CloseReport ModuleRegistry::close_all() {
    // Hooks run without the lock held so a module may query the registry
    auto modules = snapshot();
    auto logger = rhost_core::modules_logger();

    CloseReport report;
    for (const auto& [name, module] : modules) {
        if (!module) {
            continue;
        }
        if (module->is_shared_module()) {
            ++report.skipped;
            continue;
        }

        ++report.closed;
        try {
            auto result = module->close();
            if (!result) {
                rhost_core::Error err = rhost_core::ModuleError::close_failed(name, result.error().message());
                rhost_core::debug::record_error(err);
                logger->error("{}", err.message());
                ++report.failed;
            }
        } catch (const std::exception& e) {
            rhost_core::Error err = rhost_core::ModuleError::close_failed(name, e.what());
            rhost_core::debug::record_error(err);
            logger->error("{}", err.message());
            ++report.failed;
        } catch (...) {
            rhost_core::Error err = rhost_core::ModuleError::close_failed(name, "unknown exception");
            rhost_core::debug::record_error(err);
            logger->error("{}", err.message());
            ++report.failed;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_modules.clear();
        m_order.clear();
    }

    logger->debug("Closed {} module(s), {} failed, {} shared left to host",
        report.closed, report.failed, report.skipped);
    return report;
}

} // namespace rhost_scene
