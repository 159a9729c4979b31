#pragma once

/// @file events.hpp
/// @brief Scene event notifications (restart and shutdown observers)

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace rhost_scene {

// =============================================================================
// SubscriptionId
// =============================================================================

/// Unique observer subscription identifier
struct SubscriptionId {
    std::uint64_t id = 0;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr bool operator==(const SubscriptionId&) const noexcept = default;
};

// =============================================================================
// SceneEvents
// =============================================================================

/// Observer lists for scene-level notifications.
///
/// Observers are invoked in registration order, outside the internal lock,
/// so an observer may subscribe or unsubscribe while being notified (the
/// change applies from the next notification). Triggering an event with no
/// observers is a no-op.
class SceneEvents {
public:
    using RestartObserver = std::function<void(const RegionInfo&)>;
    using ShutdownObserver = std::function<void()>;

    SceneEvents() = default;

    // Non-copyable
    SceneEvents(const SceneEvents&) = delete;
    SceneEvents& operator=(const SceneEvents&) = delete;

    /// Observe region restart requests
    [[nodiscard]] SubscriptionId on_restart(RestartObserver observer);

    /// Observe scene shutdown
    [[nodiscard]] SubscriptionId on_shutdown(ShutdownObserver observer);

    /// Remove a restart or shutdown observer
    bool unsubscribe(SubscriptionId id);

    /// Notify restart observers
    /// @return number of observers notified
    std::size_t trigger_restart(const RegionInfo& info);

    /// Notify shutdown observers. An exception thrown by an observer stops
    /// delivery and propagates to the caller.
    std::size_t trigger_shutdown();

    [[nodiscard]] std::size_t restart_observer_count() const;
    [[nodiscard]] std::size_t shutdown_observer_count() const;

private:
    template<typename F>
    struct Entry {
        SubscriptionId id;
        F observer;
    };

    mutable std::mutex m_mutex;
    std::uint64_t m_next_id = 1;
    std::vector<Entry<RestartObserver>> m_restart;
    std::vector<Entry<ShutdownObserver>> m_shutdown;
};

} // namespace rhost_scene
