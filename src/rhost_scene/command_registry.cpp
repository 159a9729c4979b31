/// @file command_registry.cpp
/// @brief Command registry implementation

#include <rhost/scene/command_registry.hpp>

#include <rhost/core/log.hpp>

#include <sstream>

namespace rhost_scene {

// =============================================================================
// Commander
// =============================================================================

Commander::CommandPtr Commander::add_command(std::string name, std::string short_help,
                                             std::string long_help, CommandCallback callback) {
    auto command = std::make_shared<Command>(
        name, std::move(short_help), std::move(long_help), std::move(callback));
    m_commands[std::move(name)] = command;
    return command;
}

std::string Commander::help() const {
    std::ostringstream oss;
    if (!m_help.empty()) {
        oss << m_help << "\n";
    }
    for (const auto& [name, command] : m_commands) {
        oss << "  " << name << " - " << command->short_help() << "\n";
    }
    return oss.str();
}

rhost_core::Result<void> Commander::run(const std::string& command,
                                        const std::vector<std::string>& args) const {
    auto it = m_commands.find(command);
    if (it == m_commands.end()) {
        rhost_core::Error err = rhost_core::CommandError::not_found(command);
        err.with_context("commander", m_name);
        return rhost_core::Err(std::move(err));
    }
    it->second->run(m_name, args);
    return rhost_core::Ok();
}

// =============================================================================
// CommandRegistry
// =============================================================================

bool CommandRegistry::register_module_commander(const CommanderPtr& commander) {
    if (!commander) {
        return false;
    }

    auto logger = rhost_core::commands_logger();
    std::lock_guard<std::mutex> commanders_lock(m_commanders_mutex);

    if (m_commanders.count(commander->name())) {
        rhost_core::Error err = rhost_core::CommandError::duplicate_commander(commander->name());
        rhost_core::debug::record_error(err);
        logger->error("{}", err.message());
        return false;
    }
    m_commanders[commander->name()] = commander;

    std::lock_guard<std::mutex> commands_lock(m_commands_mutex);
    for (const auto& [name, command] : commander->commands()) {
        auto owner = m_command_owners.find(name);
        if (owner != m_command_owners.end()) {
            rhost_core::Error err = rhost_core::CommandError::duplicate_command(
                name, commander->name(), owner->second);
            rhost_core::debug::record_error(err);
            logger->error("{}", err.message());
            continue;
        }

        m_commands[name] = command;
        m_command_owners[name] = commander->name();
    }

    return true;
}

CommandRegistry::CommandPtr CommandRegistry::get_command(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_commands_mutex);
    auto it = m_commands.find(name);
    return it != m_commands.end() ? it->second : nullptr;
}

CommandRegistry::CommanderPtr CommandRegistry::get_commander(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_commanders_mutex);
    auto it = m_commanders.find(name);
    return it != m_commanders.end() ? it->second : nullptr;
}

std::string CommandRegistry::owner_of(const std::string& command) const {
    std::lock_guard<std::mutex> lock(m_commands_mutex);
    auto it = m_command_owners.find(command);
    return it != m_command_owners.end() ? it->second : std::string{};
}

std::vector<std::pair<std::string, CommandRegistry::CommanderPtr>>
CommandRegistry::commanders_snapshot() const {
    std::lock_guard<std::mutex> lock(m_commanders_mutex);
    return {m_commanders.begin(), m_commanders.end()};
}

std::size_t CommandRegistry::command_count() const {
    std::lock_guard<std::mutex> lock(m_commands_mutex);
    return m_commands.size();
}

} // namespace rhost_scene
