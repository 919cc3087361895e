/**
 * @file MockCollaborators.hpp
 * @brief Mock implementations of the collaborator interfaces
 */

#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "networking/ClientReconciliation.hpp"
#include "terrain/TerrainGenerator.hpp"

#include <atomic>

namespace Lattice {
namespace Test {

// =============================================================================
// MockChunkGenerator
// =============================================================================

/**
 * @brief Generator whose calls can be expected per coordinate
 */
class MockChunkGenerator : public IChunkGenerator {
public:
    MOCK_METHOD(void, Generate, (const ChunkCoord& coord, VoxelBuffer& voxels), (const, override));
};

/**
 * @brief Thread-safe generator that fills a single stone floor and counts calls
 */
class CountingChunkGenerator : public IChunkGenerator {
public:
    void Generate(const ChunkCoord& /*coord*/, VoxelBuffer& voxels) const override {
        for (int x = -CHUNK_PADDING; x < CHUNK_WIDTH + CHUNK_PADDING; ++x) {
            for (int z = -CHUNK_PADDING; z < CHUNK_DEPTH + CHUNK_PADDING; ++z) {
                voxels.At(x, 0, z).SetMaterial(VoxelMaterial::Stone);
            }
        }
        m_calls++;
    }

    [[nodiscard]] int GetCallCount() const { return m_calls.load(); }

private:
    mutable std::atomic<int> m_calls{0};
};

// =============================================================================
// MockPresentationFactory
// =============================================================================

class MockPresentationFactory : public IPresentationFactory {
public:
    MOCK_METHOD(void, SpawnBundle, (EntityRegistry& registry, EntityId entity, BundleKind kind), (override));
    MOCK_METHOD(void, DespawnBundle, (EntityRegistry& registry, EntityId entity), (override));
};

} // namespace Test
} // namespace Lattice
