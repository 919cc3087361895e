#pragma once

#include "scene/Entity.hpp"

#include <optional>
#include <unordered_map>

namespace Lattice {

/**
 * @brief Translates server entity ids into the client's local entity ids
 *
 * Owned by the client reconciliation engine; the only path from a
 * server-side reference to a local one. Lookups for unknown ids return
 * nullopt and log at debug level.
 */
class EntityMapping {
public:
    /**
     * @brief Bind a server id to a local id (overwrites an existing binding)
     */
    void Insert(EntityId serverId, EntityId clientId);

    [[nodiscard]] std::optional<EntityId> Lookup(EntityId serverId) const;

    /**
     * @brief Remove a binding
     * @return The local id that was bound, or nullopt if none
     */
    std::optional<EntityId> Remove(EntityId serverId);

    [[nodiscard]] bool Contains(EntityId serverId) const;
    [[nodiscard]] size_t Size() const { return m_serverToClient.size(); }
    void Clear() { m_serverToClient.clear(); }

private:
    std::unordered_map<EntityId, EntityId> m_serverToClient;
};

} // namespace Lattice
