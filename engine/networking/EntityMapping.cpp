#include "networking/EntityMapping.hpp"
#include "core/Logger.hpp"

namespace Lattice {

void EntityMapping::Insert(EntityId serverId, EntityId clientId) {
    auto [it, inserted] = m_serverToClient.insert_or_assign(serverId, clientId);
    if (!inserted) {
        LATTICE_LOG_DEBUG("EntityMapping: rebinding server entity {}", serverId.ToString());
    }
}

std::optional<EntityId> EntityMapping::Lookup(EntityId serverId) const {
    auto it = m_serverToClient.find(serverId);
    if (it == m_serverToClient.end()) {
        LATTICE_LOG_DEBUG("EntityMapping: no local entity for server entity {}", serverId.ToString());
        return std::nullopt;
    }
    return it->second;
}

std::optional<EntityId> EntityMapping::Remove(EntityId serverId) {
    auto it = m_serverToClient.find(serverId);
    if (it == m_serverToClient.end()) {
        LATTICE_LOG_DEBUG("EntityMapping: remove of unmapped server entity {}", serverId.ToString());
        return std::nullopt;
    }
    EntityId clientId = it->second;
    m_serverToClient.erase(it);
    return clientId;
}

bool EntityMapping::Contains(EntityId serverId) const {
    return m_serverToClient.contains(serverId);
}

} // namespace Lattice
