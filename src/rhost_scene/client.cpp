/// @file client.cpp
/// @brief Client table implementation

#include <rhost/scene/client.hpp>

namespace rhost_scene {

bool ClientManager::add(ClientPtr client) {
    if (!client) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    return m_clients.emplace(client->circuit_code(), std::move(client)).second;
}

bool ClientManager::remove(std::uint32_t circuit_code) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_clients.erase(circuit_code) > 0;
}

ClientManager::ClientPtr ClientManager::get(std::uint32_t circuit_code) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_clients.find(circuit_code);
    return it != m_clients.end() ? it->second : nullptr;
}

void ClientManager::for_each(const std::function<void(IClientAPI&)>& func) const {
    std::vector<ClientPtr> clients;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        clients.reserve(m_clients.size());
        for (const auto& [circuit, client] : m_clients) {
            clients.push_back(client);
        }
    }

    for (const auto& client : clients) {
        func(*client);
    }
}

std::size_t ClientManager::count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_clients.size();
}

} // namespace rhost_scene
