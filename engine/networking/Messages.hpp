#pragma once

#include "scene/Entity.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace Lattice {

// ============================================================================
// Wire Message Types
// ============================================================================

/**
 * @brief Index-aligned transform snapshot of a set of entities
 *
 * entities[i] pairs with translations[i] and rotations[i]. The three arrays
 * have equal length and no id appears twice.
 */
struct EntitySnapshot {
    std::vector<EntityId> entities;
    std::vector<glm::vec3> translations;
    std::vector<glm::quat> rotations;

    void Add(EntityId entity, const glm::vec3& translation, const glm::quat& rotation) {
        entities.push_back(entity);
        translations.push_back(translation);
        rotations.push_back(rotation);
    }

    [[nodiscard]] size_t Size() const { return entities.size(); }
    [[nodiscard]] bool Empty() const { return entities.empty(); }
};

/** @brief A player joined (server entity + spawn translation) */
struct PlayerCreate {
    ClientId id = 0;
    EntityId entity;
    glm::vec3 translation{0.0f};
};

/** @brief A player left */
struct PlayerRemove {
    ClientId id = 0;
};

/** @brief Transform snapshot of all player entities */
struct NetworkedEntities : EntitySnapshot {};

/** @brief Transform snapshot of server-owned world entities */
struct NonNetworkedEntities : EntitySnapshot {};

/** @brief A server-owned world entity was spawned */
struct EntityCreate {
    EntityId entity;
    glm::vec3 translation{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
};

/** @brief A server-owned world entity was despawned */
struct EntityRemove {
    EntityId entity;
};

/** @brief Chat line; clientId is stamped by the server on relay */
struct ChatMessage {
    ClientId clientId = 0;
    std::string text;
};

/** @brief Client's current translation */
struct PlayerInput {
    glm::vec3 translation{0.0f};
};

/** @brief Client's current look rotation */
struct RotationInput {
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
};

/**
 * @brief Discrete player action
 */
enum class CommandAction : uint8_t {
    Jump = 0,
    BreakBlock,
    PlaceBlock,
    Interact,

    Count
};

struct PlayerCommand {
    CommandAction action = CommandAction::Jump;
    glm::vec3 target{0.0f};
};

/** @brief Tells a client whether it hosts the lobby */
struct Host {
    bool isHost = false;
};

using Message = std::variant<
    PlayerCreate,
    PlayerRemove,
    NetworkedEntities,
    NonNetworkedEntities,
    ChatMessage,
    PlayerInput,
    RotationInput,
    PlayerCommand,
    Host,
    EntityCreate,
    EntityRemove
>;

/**
 * @brief One-byte wire tag of each message kind
 */
enum class MessageTag : uint8_t {
    PlayerCreate = 1,
    PlayerRemove = 2,
    NetworkedEntities = 3,
    NonNetworkedEntities = 4,
    ChatMessage = 5,
    PlayerInput = 6,
    RotationInput = 7,
    PlayerCommand = 8,
    Host = 9,
    EntityCreate = 10,
    EntityRemove = 11
};

inline const char* CommandActionToString(CommandAction action) {
    switch (action) {
        case CommandAction::Jump:       return "Jump";
        case CommandAction::BreakBlock: return "BreakBlock";
        case CommandAction::PlaceBlock: return "PlaceBlock";
        case CommandAction::Interact:   return "Interact";
        default:                        return "Unknown";
    }
}

} // namespace Lattice
