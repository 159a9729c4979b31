/// @file events.cpp
/// @brief Scene event notification implementation

#include <rhost/scene/events.hpp>

#include <algorithm>

namespace rhost_scene {

SubscriptionId SceneEvents::on_restart(RestartObserver observer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    SubscriptionId id{m_next_id++};
    m_restart.push_back({id, std::move(observer)});
    return id;
}

SubscriptionId SceneEvents::on_shutdown(ShutdownObserver observer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    SubscriptionId id{m_next_id++};
    m_shutdown.push_back({id, std::move(observer)});
    return id;
}

bool SceneEvents::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto matches = [id](const auto& entry) { return entry.id == id; };

    auto restart_it = std::remove_if(m_restart.begin(), m_restart.end(), matches);
    if (restart_it != m_restart.end()) {
        m_restart.erase(restart_it, m_restart.end());
        return true;
    }

    auto shutdown_it = std::remove_if(m_shutdown.begin(), m_shutdown.end(), matches);
    if (shutdown_it != m_shutdown.end()) {
        m_shutdown.erase(shutdown_it, m_shutdown.end());
        return true;
    }

    return false;
}

std::size_t SceneEvents::trigger_restart(const RegionInfo& info) {
    std::vector<Entry<RestartObserver>> observers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        observers = m_restart;
    }

    for (const auto& entry : observers) {
        if (entry.observer) {
            entry.observer(info);
        }
    }
    return observers.size();
}

std::size_t SceneEvents::trigger_shutdown() {
    std::vector<Entry<ShutdownObserver>> observers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        observers = m_shutdown;
    }

    for (const auto& entry : observers) {
        if (entry.observer) {
            entry.observer();
        }
    }
    return observers.size();
}

std::size_t SceneEvents::restart_observer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_restart.size();
}

std::size_t SceneEvents::shutdown_observer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shutdown.size();
}

} // namespace rhost_scene
