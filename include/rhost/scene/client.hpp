#pragma once

/// @file client.hpp
/// @brief Connected client handles and the per-scene client table

#include "fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rhost_scene {

// =============================================================================
// IClientAPI
// =============================================================================

/// A viewer connection, as seen by the scene
class IClientAPI {
public:
    virtual ~IClientAPI() = default;

    /// Circuit code identifying the connection
    [[nodiscard]] virtual std::uint32_t circuit_code() const = 0;

    /// Agent the connection belongs to
    [[nodiscard]] virtual std::string agent_id() const = 0;

    /// Send the region heightmap
    virtual void send_layer_data(const std::vector<float>& heightmap) = 0;
};

// =============================================================================
// ClientManager
// =============================================================================

/// Clients connected to a scene, keyed by circuit code
class ClientManager {
public:
    using ClientPtr = std::shared_ptr<IClientAPI>;

    ClientManager() = default;

    // Non-copyable
    ClientManager(const ClientManager&) = delete;
    ClientManager& operator=(const ClientManager&) = delete;

    /// Add a client under its circuit code
    /// @return false if the circuit is already in use or client is null
    bool add(ClientPtr client);

    /// Remove a client by circuit code
    bool remove(std::uint32_t circuit_code);

    /// Client for a circuit code, or nullptr
    [[nodiscard]] ClientPtr get(std::uint32_t circuit_code) const;

    /// Visit every client. Iterates a snapshot, so the callback may add or
    /// remove clients.
    void for_each(const std::function<void(IClientAPI&)>& func) const;

    [[nodiscard]] std::size_t count() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::uint32_t, ClientPtr> m_clients;
};

} // namespace rhost_scene
