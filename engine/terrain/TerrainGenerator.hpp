#pragma once

#include "terrain/Chunk.hpp"

namespace Lattice {

/**
 * @brief Fills the voxel data of a chunk
 *
 * Generate may be called from job system workers; implementations must be
 * safe to call concurrently for different buffers.
 */
class IChunkGenerator {
public:
    virtual ~IChunkGenerator() = default;

    virtual void Generate(const ChunkCoord& coord, VoxelBuffer& buffer) const = 0;
};

/**
 * @brief Flat strata generator
 *
 * Columns are solid from y = 0 up to the ground height: two grass layers
 * on top, then dirtDepth layers of dirt, then stone. Padding columns are
 * filled the same way so neighbouring chunks agree at the border.
 */
class LayeredTerrainGenerator : public IChunkGenerator {
public:
    struct Settings {
        int groundHeight = 64;
        int grassDepth = 2;
        int dirtDepth = 3;
    };

    LayeredTerrainGenerator();
    explicit LayeredTerrainGenerator(Settings settings);

    void Generate(const ChunkCoord& coord, VoxelBuffer& buffer) const override;

    /**
     * @brief Material at a given depth below the surface (0 = top layer)
     */
    [[nodiscard]] VoxelMaterial FillStrata(int layer) const;

    [[nodiscard]] const Settings& GetSettings() const { return m_settings; }

private:
    Settings m_settings;
};

} // namespace Lattice
