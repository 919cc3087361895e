#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <string>

namespace Lattice {

/**
 * @brief Generational entity identifier
 *
 * The index addresses a registry slot; the generation is bumped every time
 * the slot is freed so an id held past despawn never matches the slot's
 * next occupant. Server and client allocate ids independently.
 */
struct EntityId {
    uint32_t generation = 0;
    uint32_t index = 0;

    bool operator==(const EntityId& other) const = default;

    [[nodiscard]] uint64_t ToBits() const {
        return (static_cast<uint64_t>(generation) << 32) | index;
    }

    static EntityId FromBits(uint64_t bits) {
        return EntityId{static_cast<uint32_t>(bits >> 32), static_cast<uint32_t>(bits & 0xFFFFFFFFu)};
    }

    [[nodiscard]] std::string ToString() const {
        return std::to_string(index) + "v" + std::to_string(generation);
    }
};

/**
 * @brief Position and orientation of an entity
 */
struct Transform {
    glm::vec3 translation{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};

    static Transform FromTranslation(const glm::vec3& translation) {
        Transform t;
        t.translation = translation;
        return t;
    }
};

/**
 * @brief Network client identifier (assigned by the transport)
 */
using ClientId = uint64_t;

/**
 * @brief Marks an entity as the avatar of a connected client
 */
struct PlayerTag {
    ClientId id = 0;
};

/**
 * @brief Per-player gameplay counters
 */
struct PlayerStats {
    int64_t score = 0;
};

} // namespace Lattice

template<>
struct std::hash<Lattice::EntityId> {
    size_t operator()(const Lattice::EntityId& id) const noexcept {
        return std::hash<uint64_t>{}(id.ToBits());
    }
};
