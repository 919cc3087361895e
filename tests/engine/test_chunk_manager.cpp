/**
 * @file test_chunk_manager.cpp
 * @brief Unit tests for chunk streaming around a viewer
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/JobSystem.hpp"
#include "terrain/ChunkManager.hpp"

#include "utils/TestHelpers.hpp"
#include "mocks/MockCollaborators.hpp"

#include <atomic>
#include <limits>
#include <set>
#include <stdexcept>

using namespace Lattice;
using namespace Lattice::Test;
using ::testing::_;

namespace {

std::vector<ChunkCoord> SpawnCoords(const ChunkManager& manager) {
    std::vector<ChunkCoord> coords;
    for (const auto& request : manager.GetSpawnRequests()) {
        coords.push_back(request.coord);
    }
    return coords;
}

/**
 * @brief Generator that holds every call until released
 */
class GatedChunkGenerator : public IChunkGenerator {
public:
    void Generate(const ChunkCoord& /*coord*/, VoxelBuffer& voxels) const override {
        while (!m_open.load()) {
            std::this_thread::yield();
        }
        voxels.At(0, 0, 0).SetMaterial(VoxelMaterial::Stone);
        m_calls++;
    }

    void Open() { m_open = true; }
    [[nodiscard]] int GetCallCount() const { return m_calls.load(); }

private:
    std::atomic<bool> m_open{false};
    mutable std::atomic<int> m_calls{0};
};

/**
 * @brief Generator whose first call throws
 */
class FlakyChunkGenerator : public IChunkGenerator {
public:
    void Generate(const ChunkCoord& /*coord*/, VoxelBuffer& voxels) const override {
        if (m_calls++ == 0) {
            throw std::runtime_error("generator hiccup");
        }
        voxels.At(0, 0, 0).SetMaterial(VoxelMaterial::Stone);
    }

private:
    mutable std::atomic<int> m_calls{0};
};

} // namespace

// =============================================================================
// Fixture
// =============================================================================

class ChunkManagerTest : public ::testing::Test {
protected:
    void SpawnAndQueue(const std::vector<ChunkCoord>& coords) {
        for (const auto& coord : coords) {
            m_manager.RequestSpawn(coord);
        }
        m_manager.CreateChunks();
        m_manager.LoadChunkData();
    }

    CountingChunkGenerator m_generator;
    ChunkManager m_manager{m_generator};
};

// =============================================================================
// Visibility
// =============================================================================

TEST_F(ChunkManagerTest, CandidateSetIsOpenDisc) {
    m_manager.UpdateVisibleChunks(glm::vec3(0.0f), 3);

    auto requested = SpawnCoords(m_manager);

    EXPECT_EQ(25u, requested.size());
    EXPECT_EQ(SortedCoords(DiscAround(ChunkCoord(0, 0), 3)), SortedCoords(requested));

    // dx^2 + dy^2 == R^2 is outside
    for (const auto& coord : requested) {
        EXPECT_LT(coord.x * coord.x + coord.y * coord.y, 9);
    }
}

TEST_F(ChunkManagerTest, CandidatesAreNearestFirst) {
    m_manager.UpdateVisibleChunks(glm::vec3(0.0f), 4);

    auto requested = SpawnCoords(m_manager);
    ASSERT_FALSE(requested.empty());
    EXPECT_EQ(ChunkCoord(0, 0), requested.front());

    int previous = 0;
    for (const auto& coord : requested) {
        int distanceSq = coord.x * coord.x + coord.y * coord.y;
        EXPECT_GE(distanceSq, previous);
        previous = distanceSq;
    }
}

TEST_F(ChunkManagerTest, CandidatesFollowViewerChunk) {
    // World (40, y, -20) is chunk (2, -2)
    m_manager.UpdateVisibleChunks(glm::vec3(40.0f, 100.0f, -20.0f), 2);

    EXPECT_EQ(SortedCoords(DiscAround(ChunkCoord(2, -2), 2)), SortedCoords(SpawnCoords(m_manager)));
}

TEST_F(ChunkManagerTest, ResidentChunksAreNotRequestedAgain) {
    SpawnAndQueue({ChunkCoord(0, 0), ChunkCoord(1, 0)});

    m_manager.UpdateVisibleChunks(glm::vec3(0.0f), 3);

    auto requested = SpawnCoords(m_manager);
    EXPECT_EQ(23u, requested.size());
    EXPECT_THAT(requested, ::testing::Not(::testing::Contains(ChunkCoord(0, 0))));
    EXPECT_THAT(requested, ::testing::Not(::testing::Contains(ChunkCoord(1, 0))));
}

TEST_F(ChunkManagerTest, DespawnsOnlyChunksOutsideRadius) {
    SpawnAndQueue({ChunkCoord(0, 0), ChunkCoord(1, 0), ChunkCoord(5, 5)});

    m_manager.UpdateVisibleChunks(glm::vec3(0.0f), 3);

    const auto& despawns = m_manager.GetDespawnRequests();
    ASSERT_EQ(1u, despawns.size());
    EXPECT_EQ(ChunkCoord(5, 5), despawns.front().coord);

    m_manager.PrepareForUnload();
    m_manager.DestroyChunks();

    EXPECT_FALSE(m_manager.IsResident(ChunkCoord(5, 5)));
    EXPECT_TRUE(m_manager.IsResident(ChunkCoord(0, 0)));
    EXPECT_TRUE(m_manager.IsResident(ChunkCoord(1, 0)));
}

// =============================================================================
// Generation Budget
// =============================================================================

TEST_F(ChunkManagerTest, GenerationBudgetIsHalfViewDistance) {
    EXPECT_EQ(5, ChunkManager::GetGenerationBudget(10));
    EXPECT_EQ(8, ChunkManager::GetGenerationBudget(16));
    EXPECT_EQ(1, ChunkManager::GetGenerationBudget(3));
    EXPECT_EQ(1, ChunkManager::GetGenerationBudget(1));
    EXPECT_EQ(1, ChunkManager::GetGenerationBudget(0));
}

TEST_F(ChunkManagerTest, TwentyPendingAtRadiusTenLeavesFifteen) {
    std::vector<ChunkCoord> coords;
    for (int i = 0; i < 20; ++i) {
        coords.push_back(ChunkCoord(i, 100));
    }
    SpawnAndQueue(coords);
    ASSERT_EQ(20u, m_manager.GetPendingGenerationCount());

    m_manager.GenerateChunks(10);

    EXPECT_EQ(15u, m_manager.GetPendingGenerationCount());
    EXPECT_EQ(5, m_generator.GetCallCount());

    // Oldest requests are generated first
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(ChunkLoadState::Done, m_manager.GetChunk(coords[i])->GetState());
    }
    for (int i = 5; i < 20; ++i) {
        EXPECT_EQ(ChunkLoadState::Generate, m_manager.GetChunk(coords[i])->GetState());
    }
}

TEST_F(ChunkManagerTest, StaleRequestsAreSkipped) {
    SpawnAndQueue({ChunkCoord(7, 7), ChunkCoord(8, 8)});

    m_manager.RequestDespawn(ChunkCoord(7, 7));
    m_manager.PrepareForUnload();
    m_manager.DestroyChunks();

    m_manager.GenerateChunks(2);  // Budget 1, spent on the stale entry

    EXPECT_EQ(0, m_generator.GetCallCount());
    EXPECT_EQ(1u, m_manager.GetStats().staleRequestsSkipped);
    EXPECT_EQ(1u, m_manager.GetPendingGenerationCount());

    m_manager.GenerateChunks(2);

    EXPECT_EQ(1, m_generator.GetCallCount());
    EXPECT_EQ(ChunkLoadState::Done, m_manager.GetChunk(ChunkCoord(8, 8))->GetState());
}

TEST_F(ChunkManagerTest, GeneratorReceivesChunkCoordinate) {
    MockChunkGenerator generator;
    ChunkManager manager(generator);

    EXPECT_CALL(generator, Generate(ChunkCoord(3, -4), _)).Times(1);

    manager.RequestSpawn(ChunkCoord(3, -4));
    manager.CreateChunks();
    manager.LoadChunkData();
    manager.GenerateChunks(1);
}

// =============================================================================
// Full Ticks
// =============================================================================

TEST_F(ChunkManagerTest, TickStreamsDiscAroundViewer) {
    std::set<ChunkHandle> handles;
    for (int tick = 0; tick < 40; ++tick) {
        m_manager.Tick(glm::vec3(8.0f, 64.0f, 8.0f), 3);
        for (const auto& ready : m_manager.DrainReadyEvents()) {
            EXPECT_TRUE(handles.insert(ready.handle).second);
        }
    }

    EXPECT_EQ(25u, handles.size());
    EXPECT_EQ(25u, m_manager.GetChunkCount());
    EXPECT_EQ(25, m_generator.GetCallCount());
    for (const auto& [coord, chunk] : m_manager.GetChunks()) {
        EXPECT_EQ(ChunkLoadState::Done, chunk->GetState());
        EXPECT_EQ(VoxelMaterial::Stone, chunk->GetVoxels().At(0, 0, 0).GetMaterial());
    }
}

TEST_F(ChunkManagerTest, MovingViewerUnloadsTrailingChunks) {
    std::vector<ChunkCoord> unloaded;
    m_manager.SetOnChunkUnloaded([&unloaded](const ChunkCoord& coord) {
        unloaded.push_back(coord);
    });

    for (int tick = 0; tick < 20; ++tick) {
        m_manager.Tick(glm::vec3(0.0f), 2);
    }
    ASSERT_EQ(9u, m_manager.GetChunkCount());

    // Jump 10 chunks along +x: every old chunk is now out of range
    m_manager.Tick(glm::vec3(160.0f, 0.0f, 0.0f), 2);

    EXPECT_EQ(9u, unloaded.size());
    for (const auto& coord : DiscAround(ChunkCoord(0, 0), 2)) {
        EXPECT_FALSE(m_manager.IsResident(coord));
    }
    EXPECT_EQ(9u, m_manager.GetChunkCount());
    EXPECT_EQ(9u, m_manager.GetStats().chunksDestroyed);
}

TEST_F(ChunkManagerTest, ChunkUnloadedBeforeReadyRaisesNoEvent) {
    m_manager.RequestSpawn(ChunkCoord(5, 5));
    m_manager.CreateChunks();
    m_manager.LoadChunkData();
    m_manager.GenerateChunks(3);

    m_manager.RequestDespawn(ChunkCoord(5, 5));
    m_manager.PrepareForUnload();
    m_manager.MarkChunksReady();
    m_manager.DestroyChunks();

    EXPECT_TRUE(m_manager.DrainReadyEvents().empty());
    EXPECT_FALSE(m_manager.IsResident(ChunkCoord(5, 5)));
}

TEST_F(ChunkManagerTest, RespawnedCoordinateGetsNewHandle) {
    SpawnAndQueue({ChunkCoord(1, 1)});
    ChunkHandle first = m_manager.GetChunk(ChunkCoord(1, 1))->GetHandle();

    m_manager.RequestDespawn(ChunkCoord(1, 1));
    m_manager.PrepareForUnload();
    m_manager.DestroyChunks();

    SpawnAndQueue({ChunkCoord(1, 1)});
    EXPECT_NE(first, m_manager.GetChunk(ChunkCoord(1, 1))->GetHandle());
}

TEST_F(ChunkManagerTest, DespawnRequestForUnknownChunkIsIgnored) {
    m_manager.RequestDespawn(ChunkCoord(42, 42));
    EXPECT_TRUE(m_manager.GetDespawnRequests().empty());
}

// =============================================================================
// Bounded Queue
// =============================================================================

TEST(ChunkManagerQueueTest, FullQueueKeepsChunksInLoad) {
    CountingChunkGenerator generator;
    ChunkManagerSettings settings;
    settings.maxPendingGeneration = 2;
    ChunkManager manager(generator, settings);

    for (int i = 0; i < 5; ++i) {
        manager.RequestSpawn(ChunkCoord(i, 0));
    }
    manager.CreateChunks();
    manager.LoadChunkData();

    EXPECT_EQ(2u, manager.GetPendingGenerationCount());
    EXPECT_EQ(ChunkLoadState::Generate, manager.GetChunk(ChunkCoord(1, 0))->GetState());
    EXPECT_EQ(ChunkLoadState::Load, manager.GetChunk(ChunkCoord(2, 0))->GetState());

    manager.GenerateChunks(2);
    manager.LoadChunkData();

    EXPECT_EQ(2u, manager.GetPendingGenerationCount());
    EXPECT_EQ(ChunkLoadState::Generate, manager.GetChunk(ChunkCoord(2, 0))->GetState());
    EXPECT_EQ(ChunkLoadState::Load, manager.GetChunk(ChunkCoord(3, 0))->GetState());
}

// =============================================================================
// Async Generation
// =============================================================================

class ChunkManagerAsyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        JobSystemConfig config;
        config.workerThreads = 2;
        ASSERT_TRUE(m_jobs.Initialize(config));
    }

    JobSystem m_jobs;
};

TEST_F(ChunkManagerAsyncTest, GeneratesOnWorkers) {
    CountingChunkGenerator generator;
    ChunkManagerSettings settings;
    settings.asyncGeneration = true;
    ChunkManager manager(generator, settings, &m_jobs);

    size_t ready = 0;
    bool done = WaitUntil(
        [&ready]() { return ready == 25; },
        [&]() {
            manager.Tick(glm::vec3(0.0f), 3);
            ready += manager.DrainReadyEvents().size();
        },
        std::chrono::milliseconds(5000));

    EXPECT_TRUE(done);
    EXPECT_EQ(25, generator.GetCallCount());
    EXPECT_EQ(0u, manager.GetInFlightCount());
    for (const auto& [coord, chunk] : manager.GetChunks()) {
        EXPECT_EQ(ChunkLoadState::Done, chunk->GetState());
        EXPECT_EQ(VoxelMaterial::Stone, chunk->GetVoxels().At(1, 0, 1).GetMaterial());
    }
}

TEST_F(ChunkManagerAsyncTest, UnloadDuringGenerationDiscardsResult) {
    GatedChunkGenerator generator;
    ChunkManagerSettings settings;
    settings.asyncGeneration = true;
    ChunkManager manager(generator, settings, &m_jobs);

    manager.RequestSpawn(ChunkCoord(0, 0));
    manager.CreateChunks();
    manager.LoadChunkData();
    manager.GenerateChunks(1);
    ASSERT_EQ(1u, manager.GetInFlightCount());

    manager.RequestDespawn(ChunkCoord(0, 0));
    manager.PrepareForUnload();
    manager.DestroyChunks();
    EXPECT_FALSE(manager.IsResident(ChunkCoord(0, 0)));

    // Respawn the same coordinate while the old task still runs
    manager.RequestSpawn(ChunkCoord(0, 0));
    manager.CreateChunks();
    manager.LoadChunkData();
    manager.GenerateChunks(1);
    EXPECT_EQ(1u, manager.GetInFlightCount());
    EXPECT_EQ(1u, manager.GetPendingGenerationCount());

    generator.Open();

    std::vector<ChunkReadyEvent> ready;
    bool done = WaitUntil(
        [&ready]() { return !ready.empty(); },
        [&]() {
            manager.CompleteAsyncGeneration();
            manager.GenerateChunks(1);
            manager.MarkChunksReady();
            for (const auto& event : manager.DrainReadyEvents()) {
                ready.push_back(event);
            }
        });

    ASSERT_TRUE(done);
    EXPECT_EQ(1u, manager.GetStats().resultsDiscarded);
    ASSERT_EQ(1u, ready.size());
    EXPECT_EQ(manager.GetChunk(ChunkCoord(0, 0))->GetHandle(), ready.front().handle);
    EXPECT_EQ(ChunkLoadState::Done, manager.GetChunk(ChunkCoord(0, 0))->GetState());
    EXPECT_EQ(2, generator.GetCallCount());
}

TEST_F(ChunkManagerAsyncTest, FailedGenerationRetried) {
    FlakyChunkGenerator generator;
    ChunkManagerSettings settings;
    settings.asyncGeneration = true;
    ChunkManager manager(generator, settings, &m_jobs);

    bool ready = WaitUntil(
        [&manager]() {
            const Chunk* chunk = manager.GetChunk(ChunkCoord(0, 0));
            return chunk && chunk->GetState() == ChunkLoadState::Done;
        },
        [&manager]() { manager.Tick(glm::vec3(0.0f), 1); });

    ASSERT_TRUE(ready);
    EXPECT_EQ(1u, manager.GetStats().generationRetries);
    EXPECT_EQ(VoxelMaterial::Stone, manager.GetChunk(ChunkCoord(0, 0))->GetVoxels().At(0, 0, 0).GetMaterial());
}

TEST_F(ChunkManagerAsyncTest, FailedGenerationRespectsQueueBound) {
    FlakyChunkGenerator generator;
    ChunkManagerSettings settings;
    settings.asyncGeneration = true;
    settings.maxPendingGeneration = 1;
    ChunkManager manager(generator, settings, &m_jobs);

    manager.RequestSpawn(ChunkCoord(0, 0));
    manager.CreateChunks();
    manager.LoadChunkData();
    manager.GenerateChunks(1);

    // Fill the queue while the first job fails
    manager.RequestSpawn(ChunkCoord(1, 0));
    manager.CreateChunks();
    manager.LoadChunkData();
    ASSERT_EQ(1u, manager.GetPendingGenerationCount());

    ASSERT_TRUE(WaitUntil([&manager]() { return manager.GetStats().generationRetries == 1; },
                          [&manager]() { manager.CompleteAsyncGeneration(); }));
    EXPECT_EQ(1u, manager.GetPendingGenerationCount());

    manager.LoadChunkData();
    EXPECT_EQ(1u, manager.GetPendingGenerationCount());
    EXPECT_EQ(ChunkLoadState::Generate, manager.GetChunk(ChunkCoord(0, 0))->GetState());

    auto allDone = [&manager]() {
        for (const ChunkCoord coord : {ChunkCoord(0, 0), ChunkCoord(1, 0)}) {
            const Chunk* chunk = manager.GetChunk(coord);
            if (!chunk || chunk->GetState() != ChunkLoadState::Done) {
                return false;
            }
        }
        return true;
    };
    ASSERT_TRUE(WaitUntil(allDone, [&manager]() {
        manager.CompleteAsyncGeneration();
        manager.LoadChunkData();
        EXPECT_LE(manager.GetPendingGenerationCount(), 1u);
        manager.GenerateChunks(1);
    }));
}

TEST_F(ChunkManagerAsyncTest, InFlightCoordinateDoesNotStallOthers) {
    GatedChunkGenerator generator;
    ChunkManagerSettings settings;
    settings.asyncGeneration = true;
    ChunkManager manager(generator, settings, &m_jobs);

    manager.RequestSpawn(ChunkCoord(0, 0));
    manager.CreateChunks();
    manager.LoadChunkData();
    manager.GenerateChunks(1);
    manager.RequestDespawn(ChunkCoord(0, 0));
    manager.PrepareForUnload();
    manager.DestroyChunks();

    // (0, 0) is popped first but its old task is still running
    manager.RequestSpawn(ChunkCoord(0, 0));
    manager.RequestSpawn(ChunkCoord(1, 0));
    manager.CreateChunks();
    manager.LoadChunkData();
    manager.GenerateChunks(4);

    EXPECT_EQ(2u, manager.GetInFlightCount());
    ASSERT_EQ(1u, manager.GetPendingGenerationCount());

    generator.Open();

    auto allDone = [&manager]() {
        for (const ChunkCoord coord : {ChunkCoord(0, 0), ChunkCoord(1, 0)}) {
            const Chunk* chunk = manager.GetChunk(coord);
            if (!chunk || chunk->GetState() != ChunkLoadState::Done) {
                return false;
            }
        }
        return true;
    };
    ASSERT_TRUE(WaitUntil(allDone, [&manager]() {
        manager.CompleteAsyncGeneration();
        manager.GenerateChunks(4);
    }));
    EXPECT_EQ(1u, manager.GetStats().resultsDiscarded);
    EXPECT_EQ(3, generator.GetCallCount());
}

TEST_F(ChunkManagerAsyncTest, WithoutJobSystemGeneratesInline) {
    CountingChunkGenerator generator;
    ChunkManagerSettings settings;
    settings.asyncGeneration = true;
    ChunkManager manager(generator, settings, nullptr);

    manager.RequestSpawn(ChunkCoord(0, 0));
    manager.CreateChunks();
    manager.LoadChunkData();
    manager.GenerateChunks(1);

    EXPECT_EQ(0u, manager.GetInFlightCount());
    EXPECT_EQ(ChunkLoadState::Done, manager.GetChunk(ChunkCoord(0, 0))->GetState());
}

TEST(ChunkManagerCoordTest, WorldToChunkFloors) {
    EXPECT_EQ(ChunkCoord(0, 0), ChunkManager::WorldToChunk(glm::vec3(0.0f, 500.0f, 15.9f)));
    EXPECT_EQ(ChunkCoord(-1, 0), ChunkManager::WorldToChunk(glm::vec3(-0.5f, 0.0f, 0.0f)));
    EXPECT_EQ(ChunkCoord(1, -1), ChunkManager::WorldToChunk(glm::vec3(16.0f, 0.0f, -16.0f)));
    EXPECT_EQ(ChunkCoord(-2, -2), ChunkManager::WorldToChunk(glm::vec3(-17.0f, 0.0f, -32.0f)));
}

TEST(ChunkManagerCoordTest, WorldToChunkHandlesNonFinite) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    constexpr int limit = ChunkManager::MAX_CHUNK_COORDINATE;

    EXPECT_EQ(ChunkCoord(0, 0), ChunkManager::WorldToChunk(glm::vec3(nan, 0.0f, nan)));
    EXPECT_EQ(ChunkCoord(limit, -limit), ChunkManager::WorldToChunk(glm::vec3(inf, 0.0f, -inf)));
    EXPECT_EQ(ChunkCoord(-limit, limit), ChunkManager::WorldToChunk(glm::vec3(-1.0e30f, 0.0f, 1.0e30f)));
}

TEST(ChunkManagerCoordTest, DistantViewerUnloadsOrigin) {
    CountingChunkGenerator generator;
    ChunkManager manager(generator, ChunkManagerSettings{});

    for (int i = 0; i < 20; ++i) {
        manager.Tick(glm::vec3(0.0f), 2);
    }
    ASSERT_TRUE(manager.IsResident(ChunkCoord(0, 0)));

    manager.Tick(glm::vec3(1.0e12f, 0.0f, 1.0e12f), 2);

    EXPECT_FALSE(manager.IsResident(ChunkCoord(0, 0)));
    constexpr int limit = ChunkManager::MAX_CHUNK_COORDINATE;
    EXPECT_TRUE(manager.IsResident(ChunkCoord(limit, limit)));
    EXPECT_EQ(9u, manager.GetChunkCount());
}
