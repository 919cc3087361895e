#include "terrain/TerrainGenerator.hpp"

#include <algorithm>

namespace Lattice {

LayeredTerrainGenerator::LayeredTerrainGenerator()
    : LayeredTerrainGenerator(Settings{}) {
}

LayeredTerrainGenerator::LayeredTerrainGenerator(Settings settings)
    : m_settings(settings) {
    m_settings.groundHeight = std::clamp(m_settings.groundHeight, 0, CHUNK_HEIGHT);
}

VoxelMaterial LayeredTerrainGenerator::FillStrata(int layer) const {
    if (layer < m_settings.grassDepth) {
        return VoxelMaterial::Grass;
    }
    if (layer < m_settings.grassDepth + m_settings.dirtDepth) {
        return VoxelMaterial::Dirt;
    }
    return VoxelMaterial::Stone;
}

void LayeredTerrainGenerator::Generate(const ChunkCoord& /*coord*/, VoxelBuffer& buffer) const {
    const int top = m_settings.groundHeight;

    for (int z = -CHUNK_PADDING; z < CHUNK_DEPTH + CHUNK_PADDING; ++z) {
        for (int x = -CHUNK_PADDING; x < CHUNK_WIDTH + CHUNK_PADDING; ++x) {
            for (int y = 0; y < top; ++y) {
                buffer.At(x, y, z).SetMaterial(FillStrata(top - 1 - y));
            }
        }
    }
}

} // namespace Lattice
