#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace Lattice {

// ============================================================================
// Chunk dimensions
// ============================================================================

inline constexpr int CHUNK_WIDTH = 16;      // x
inline constexpr int CHUNK_HEIGHT = 256;    // y
inline constexpr int CHUNK_DEPTH = 16;      // z
inline constexpr int CHUNK_PADDING = 1;     // Voxels of border on every side

inline constexpr int PADDED_WIDTH = CHUNK_WIDTH + 2 * CHUNK_PADDING;
inline constexpr int PADDED_HEIGHT = CHUNK_HEIGHT + 2 * CHUNK_PADDING;
inline constexpr int PADDED_DEPTH = CHUNK_DEPTH + 2 * CHUNK_PADDING;

/**
 * @brief Voxel material type (attribute 0 of a voxel)
 */
enum class VoxelMaterial : uint8_t {
    Air = 0,
    Grass,
    Dirt,
    Stone
};

/**
 * @brief Single voxel: four attribute bytes, attribute 0 is the material
 */
struct Voxel {
    std::array<uint8_t, 4> attributes{};

    [[nodiscard]] VoxelMaterial GetMaterial() const { return static_cast<VoxelMaterial>(attributes[0]); }
    void SetMaterial(VoxelMaterial material) { attributes[0] = static_cast<uint8_t>(material); }
    [[nodiscard]] bool IsSolid() const { return GetMaterial() != VoxelMaterial::Air; }

    bool operator==(const Voxel& other) const = default;
};

/**
 * @brief Chunk column coordinate (x and z of the chunk grid)
 */
using ChunkCoord = glm::ivec2;

struct ChunkCoordHash {
    size_t operator()(const ChunkCoord& coord) const {
        return std::hash<int>()(coord.x) ^ (std::hash<int>()(coord.y) << 1);
    }
};

/**
 * @brief Unique identity of a chunk instance; a re-spawned coordinate gets a new handle
 */
using ChunkHandle = uint64_t;

/**
 * @brief Chunk load state
 *
 * Load -> Generate -> Done; any state -> Unload; Unload is terminal.
 */
enum class ChunkLoadState : uint8_t {
    Load,       // Created, waiting to be queued for generation
    Generate,   // Queued or being generated
    Done,       // Voxel data complete
    Unload      // Destroyed in the next destroy pass
};

[[nodiscard]] bool IsValidTransition(ChunkLoadState from, ChunkLoadState to);
[[nodiscard]] const char* ChunkLoadStateToString(ChunkLoadState state);

/**
 * @brief Padded voxel storage of one chunk
 *
 * Local coordinates run from -CHUNK_PADDING to CHUNK_WIDTH/HEIGHT/DEPTH
 * inclusive of the padding layer.
 */
class VoxelBuffer {
public:
    static constexpr size_t VOXEL_COUNT =
        static_cast<size_t>(PADDED_WIDTH) * PADDED_HEIGHT * PADDED_DEPTH;

    VoxelBuffer();

    [[nodiscard]] Voxel& At(int x, int y, int z) { return m_voxels[GetIndex(x, y, z)]; }
    [[nodiscard]] const Voxel& At(int x, int y, int z) const { return m_voxels[GetIndex(x, y, z)]; }

    [[nodiscard]] static bool InBounds(int x, int y, int z) {
        return x >= -CHUNK_PADDING && x < CHUNK_WIDTH + CHUNK_PADDING &&
               y >= -CHUNK_PADDING && y < CHUNK_HEIGHT + CHUNK_PADDING &&
               z >= -CHUNK_PADDING && z < CHUNK_DEPTH + CHUNK_PADDING;
    }

    [[nodiscard]] size_t CountMaterial(VoxelMaterial material) const;
    [[nodiscard]] bool IsEmpty() const;
    [[nodiscard]] size_t Size() const { return m_voxels.size(); }

    void Clear();

private:
    [[nodiscard]] static size_t GetIndex(int x, int y, int z) {
        return static_cast<size_t>(x + CHUNK_PADDING) +
               static_cast<size_t>(y + CHUNK_PADDING) * PADDED_WIDTH +
               static_cast<size_t>(z + CHUNK_PADDING) * PADDED_WIDTH * PADDED_HEIGHT;
    }

    std::vector<Voxel> m_voxels;
};

/**
 * @brief One resident chunk column
 */
class Chunk {
public:
    Chunk(ChunkCoord coord, ChunkHandle handle);

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    [[nodiscard]] const ChunkCoord& GetCoord() const { return m_coord; }
    [[nodiscard]] ChunkHandle GetHandle() const { return m_handle; }
    [[nodiscard]] ChunkLoadState GetState() const { return m_state; }

    /**
     * @brief Move to a new load state
     * @return false (state unchanged) if the transition is not allowed
     */
    bool TransitionTo(ChunkLoadState next);

    [[nodiscard]] VoxelBuffer& GetVoxels() { return m_voxels; }
    [[nodiscard]] const VoxelBuffer& GetVoxels() const { return m_voxels; }

    /**
     * @brief Replace the voxel data (used to publish off-thread generation)
     */
    void SwapVoxels(VoxelBuffer& other) { std::swap(m_voxels, other); }

    /**
     * @brief World-space position of local voxel (0, 0, 0)
     */
    [[nodiscard]] glm::vec3 GetWorldOrigin() const {
        return glm::vec3(m_coord.x * CHUNK_WIDTH, 0.0f, m_coord.y * CHUNK_DEPTH);
    }

private:
    ChunkCoord m_coord;
    ChunkHandle m_handle;
    ChunkLoadState m_state = ChunkLoadState::Load;
    VoxelBuffer m_voxels;
};

} // namespace Lattice
