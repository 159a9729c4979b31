#pragma once

/// @file command_registry.hpp
/// @brief Module commands, commanders and the scene-wide command namespace

#include "fwd.hpp"

#include <rhost/core/error.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace rhost_scene {

// =============================================================================
// Command
// =============================================================================

/// Callback invoked when a command runs: (module name, arguments)
using CommandCallback = std::function<void(const std::string&, const std::vector<std::string>&)>;

/// A named, invokable action with help text
class Command {
public:
    Command(std::string name, std::string short_help, std::string long_help, CommandCallback callback)
        : m_name(std::move(name))
        , m_short_help(std::move(short_help))
        , m_long_help(std::move(long_help))
        , m_callback(std::move(callback)) {}

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const std::string& short_help() const noexcept { return m_short_help; }
    [[nodiscard]] const std::string& long_help() const noexcept { return m_long_help; }
    [[nodiscard]] const CommandCallback& callback() const noexcept { return m_callback; }

    /// Invoke the callback (no-op when none is set)
    void run(const std::string& module_name, const std::vector<std::string>& args) const {
        if (m_callback) {
            m_callback(module_name, args);
        }
    }

private:
    std::string m_name;
    std::string m_short_help;
    std::string m_long_help;
    CommandCallback m_callback;
};

// =============================================================================
// Commander
// =============================================================================

/// A named group of commands exposed by a module
class Commander {
public:
    using CommandPtr = std::shared_ptr<Command>;

    explicit Commander(std::string name, std::string help = {})
        : m_name(std::move(name)), m_help(std::move(help)) {}

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    /// Add a command; a second command with the same name replaces the first
    CommandPtr add_command(std::string name, std::string short_help, std::string long_help,
                           CommandCallback callback);

    /// Commands owned by this commander, by name
    [[nodiscard]] const std::map<std::string, CommandPtr>& commands() const noexcept {
        return m_commands;
    }

    /// One line per command: "name - short help"
    [[nodiscard]] std::string help() const;

    /// Run one of this commander's commands
    rhost_core::Result<void> run(const std::string& command, const std::vector<std::string>& args) const;

private:
    std::string m_name;
    std::string m_help;
    std::map<std::string, CommandPtr> m_commands;
};

// =============================================================================
// Console sink
// =============================================================================

/// Console that accepts command registrations forwarded by a scene
class ICommandConsole {
public:
    virtual ~ICommandConsole() = default;

    virtual void add_command(const std::string& module_name, bool shared,
                             const std::string& command, const std::string& short_help,
                             const std::string& long_help, CommandCallback callback) = 0;
};

// =============================================================================
// Command Registry
// =============================================================================

/// Commanders by name, plus one flat namespace of command names shared by
/// all commanders. A command name belongs to the first commander that
/// registers it.
///
/// Lock order: commander map outer, command map inner.
class CommandRegistry {
public:
    using CommanderPtr = std::shared_ptr<Commander>;
    using CommandPtr = std::shared_ptr<Command>;
    using CommanderMap = std::map<std::string, CommanderPtr>;

    CommandRegistry() = default;

    // Non-copyable
    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    /// Register a commander and publish its commands.
    ///
    /// Commands whose name is already owned by another commander are logged
    /// and skipped. A commander whose name is already registered is rejected
    /// as a whole.
    /// @return false if the commander was rejected
    bool register_module_commander(const CommanderPtr& commander);

    /// Command by name, or nullptr
    [[nodiscard]] CommandPtr get_command(const std::string& name) const;

    /// Commander by name, or nullptr
    [[nodiscard]] CommanderPtr get_commander(const std::string& name) const;

    /// Name of the commander that owns a command, or empty
    [[nodiscard]] std::string owner_of(const std::string& command) const;

    /// The live commander map. Not a copy and not locked: only safe while no
    /// commander is being registered concurrently.
    [[nodiscard]] CommanderMap& get_commanders() noexcept { return m_commanders; }
    [[nodiscard]] const CommanderMap& get_commanders() const noexcept { return m_commanders; }

    /// Copy of the commanders, by name, taken under the commander lock
    [[nodiscard]] std::vector<std::pair<std::string, CommanderPtr>> commanders_snapshot() const;

    [[nodiscard]] std::size_t command_count() const;

private:
    mutable std::mutex m_commanders_mutex;
    CommanderMap m_commanders;

    mutable std::mutex m_commands_mutex;
    std::map<std::string, CommandPtr> m_commands;
    std::map<std::string, std::string> m_command_owners;
};

} // namespace rhost_scene
