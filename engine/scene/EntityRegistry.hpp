#pragma once

#include "scene/Entity.hpp"

#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

namespace Lattice {

/**
 * @brief Slot storage for simulated entities and their components
 *
 * Uses a free list of slot indices (O(1) spawn/despawn) with a generation
 * per slot. Components are stored inline in the slot; optional components
 * are std::optional.
 */
class EntityRegistry {
public:
    EntityRegistry() = default;

    // Non-copyable, movable
    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;
    EntityRegistry(EntityRegistry&&) noexcept = default;
    EntityRegistry& operator=(EntityRegistry&&) noexcept = default;

    /**
     * @brief Create an entity with the given transform
     */
    EntityId Spawn(const Transform& transform = {});

    /**
     * @brief Destroy an entity
     * @return false if the id is stale or unknown
     */
    bool Despawn(EntityId id);

    [[nodiscard]] bool IsAlive(EntityId id) const;

    [[nodiscard]] size_t GetAliveCount() const { return m_aliveCount; }

    // =========================================================================
    // Transform
    // =========================================================================

    [[nodiscard]] const Transform* GetTransform(EntityId id) const;

    /**
     * @brief Overwrite an entity's transform
     * @return false if the id is stale or unknown
     */
    bool SetTransform(EntityId id, const Transform& transform);

    /**
     * @brief Number of successful SetTransform calls since construction
     */
    [[nodiscard]] uint64_t GetTransformWriteCount() const { return m_transformWrites; }

    // =========================================================================
    // Components
    // =========================================================================

    bool SetPlayer(EntityId id, PlayerTag tag);
    [[nodiscard]] std::optional<PlayerTag> GetPlayer(EntityId id) const;

    bool SetControlled(EntityId id, bool controlled);
    [[nodiscard]] bool IsControlled(EntityId id) const;

    bool SetStats(EntityId id, PlayerStats stats);
    [[nodiscard]] PlayerStats* GetStats(EntityId id);
    [[nodiscard]] const PlayerStats* GetStats(EntityId id) const;

    /**
     * @brief Find the (single) controlled entity, if any
     */
    [[nodiscard]] std::optional<EntityId> FindControlled() const;

    /**
     * @brief Visit every live entity in slot order
     */
    void ForEach(const std::function<void(EntityId, const Transform&)>& func) const;

    void Clear();

private:
    struct Slot {
        uint32_t generation = 0;
        bool alive = false;
        Transform transform;
        std::optional<PlayerTag> player;
        std::optional<PlayerStats> stats;
        bool controlled = false;
    };

    Slot* Resolve(EntityId id);
    const Slot* Resolve(EntityId id) const;

    std::vector<Slot> m_slots;
    std::vector<uint32_t> m_freeList;
    size_t m_aliveCount = 0;
    uint64_t m_transformWrites = 0;
};

} // namespace Lattice
