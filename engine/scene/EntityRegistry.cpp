#include "scene/EntityRegistry.hpp"

namespace Lattice {

EntityId EntityRegistry::Spawn(const Transform& transform) {
    uint32_t index;
    if (!m_freeList.empty()) {
        index = m_freeList.back();
        m_freeList.pop_back();
    } else {
        index = static_cast<uint32_t>(m_slots.size());
        m_slots.emplace_back();
    }

    Slot& slot = m_slots[index];
    slot.alive = true;
    slot.transform = transform;
    slot.player.reset();
    slot.stats.reset();
    slot.controlled = false;
    ++m_aliveCount;

    return EntityId{slot.generation, index};
}

bool EntityRegistry::Despawn(EntityId id) {
    Slot* slot = Resolve(id);
    if (!slot) {
        return false;
    }

    slot->alive = false;
    slot->player.reset();
    slot->stats.reset();
    slot->controlled = false;
    ++slot->generation;
    m_freeList.push_back(id.index);
    --m_aliveCount;
    return true;
}

bool EntityRegistry::IsAlive(EntityId id) const {
    return Resolve(id) != nullptr;
}

const Transform* EntityRegistry::GetTransform(EntityId id) const {
    const Slot* slot = Resolve(id);
    return slot ? &slot->transform : nullptr;
}

bool EntityRegistry::SetTransform(EntityId id, const Transform& transform) {
    Slot* slot = Resolve(id);
    if (!slot) {
        return false;
    }
    slot->transform = transform;
    ++m_transformWrites;
    return true;
}

bool EntityRegistry::SetPlayer(EntityId id, PlayerTag tag) {
    Slot* slot = Resolve(id);
    if (!slot) {
        return false;
    }
    slot->player = tag;
    return true;
}

std::optional<PlayerTag> EntityRegistry::GetPlayer(EntityId id) const {
    const Slot* slot = Resolve(id);
    return slot ? slot->player : std::nullopt;
}

bool EntityRegistry::SetControlled(EntityId id, bool controlled) {
    Slot* slot = Resolve(id);
    if (!slot) {
        return false;
    }
    slot->controlled = controlled;
    return true;
}

bool EntityRegistry::IsControlled(EntityId id) const {
    const Slot* slot = Resolve(id);
    return slot && slot->controlled;
}

bool EntityRegistry::SetStats(EntityId id, PlayerStats stats) {
    Slot* slot = Resolve(id);
    if (!slot) {
        return false;
    }
    slot->stats = stats;
    return true;
}

PlayerStats* EntityRegistry::GetStats(EntityId id) {
    Slot* slot = Resolve(id);
    return (slot && slot->stats) ? &*slot->stats : nullptr;
}

const PlayerStats* EntityRegistry::GetStats(EntityId id) const {
    const Slot* slot = Resolve(id);
    return (slot && slot->stats) ? &*slot->stats : nullptr;
}

std::optional<EntityId> EntityRegistry::FindControlled() const {
    for (uint32_t i = 0; i < m_slots.size(); ++i) {
        const Slot& slot = m_slots[i];
        if (slot.alive && slot.controlled) {
            return EntityId{slot.generation, i};
        }
    }
    return std::nullopt;
}

void EntityRegistry::ForEach(const std::function<void(EntityId, const Transform&)>& func) const {
    for (uint32_t i = 0; i < m_slots.size(); ++i) {
        const Slot& slot = m_slots[i];
        if (slot.alive) {
            func(EntityId{slot.generation, i}, slot.transform);
        }
    }
}

void EntityRegistry::Clear() {
    m_freeList.clear();
    for (uint32_t i = 0; i < m_slots.size(); ++i) {
        Slot& slot = m_slots[i];
        if (slot.alive) {
            slot.alive = false;
            ++slot.generation;
        }
        slot.player.reset();
        slot.stats.reset();
        slot.controlled = false;
        m_freeList.push_back(i);
    }
    m_aliveCount = 0;
}

EntityRegistry::Slot* EntityRegistry::Resolve(EntityId id) {
    if (id.index >= m_slots.size()) {
        return nullptr;
    }
    Slot& slot = m_slots[id.index];
    return (slot.alive && slot.generation == id.generation) ? &slot : nullptr;
}

const EntityRegistry::Slot* EntityRegistry::Resolve(EntityId id) const {
    if (id.index >= m_slots.size()) {
        return nullptr;
    }
    const Slot& slot = m_slots[id.index];
    return (slot.alive && slot.generation == id.generation) ? &slot : nullptr;
}

} // namespace Lattice
