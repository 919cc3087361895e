#pragma once

#include "terrain/Chunk.hpp"
#include "terrain/TerrainGenerator.hpp"
#include "core/JobSystem.hpp"

#include <glm/glm.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace Lattice {

/**
 * @brief Raised once when a chunk's voxel data is complete
 */
struct ChunkReadyEvent {
    ChunkCoord coord{0};
    ChunkHandle handle = 0;
};

struct ChunkSpawnRequest {
    ChunkCoord coord{0};
};

struct ChunkDespawnRequest {
    ChunkCoord coord{0};
    ChunkHandle handle = 0;
};

struct ChunkManagerSettings {
    size_t maxPendingGeneration = 4096;   // Bound of the generation queue
    bool asyncGeneration = false;         // Generate on the job system
};

/**
 * @brief Chunk streaming statistics
 */
struct ChunkManagerStats {
    size_t residentChunks = 0;
    size_t pendingGeneration = 0;
    size_t inFlightGeneration = 0;
    uint64_t chunksSpawned = 0;
    uint64_t chunksGenerated = 0;
    uint64_t chunksDestroyed = 0;
    uint64_t staleRequestsSkipped = 0;    // Popped for a chunk already unloaded or gone
    uint64_t resultsDiscarded = 0;        // Async results whose chunk was unloaded
    uint64_t generationRetries = 0;       // Async jobs that failed or were cancelled
};

/**
 * @brief Streams voxel chunks in and out around a moving viewer
 *
 * Tick runs, in order: async completion, visibility update, chunk
 * creation, Load -> Generate queueing, bounded generation, unload marking,
 * ready events, destruction. The chunk map is mutated only from Tick.
 */
class ChunkManager {
public:
    using ChunkMap = std::unordered_map<ChunkCoord, std::unique_ptr<Chunk>, ChunkCoordHash>;
    using UnloadCallback = std::function<void(const ChunkCoord&)>;

    /**
     * @param generator Fills voxel data; must outlive the manager and its jobs
     * @param jobs Job system for async generation (null = always inline)
     */
    explicit ChunkManager(const IChunkGenerator& generator,
                          ChunkManagerSettings settings = {},
                          JobSystem* jobs = nullptr);
    ~ChunkManager();

    ChunkManager(const ChunkManager&) = delete;
    ChunkManager& operator=(const ChunkManager&) = delete;

    /**
     * @brief Run one streaming tick around the viewer
     * @param viewerPosition World-space viewer position
     * @param viewDistance View radius R in chunks
     */
    void Tick(const glm::vec3& viewerPosition, int viewDistance);

    // =========================================================================
    // Tick stages
    // =========================================================================

    /**
     * @brief Publish finished off-thread generation results
     */
    void CompleteAsyncGeneration();

    /**
     * @brief Recompute the spawn and despawn request queues
     *
     * Spawn: offsets with dx^2 + dy^2 < R^2 not resident, nearest first.
     * Despawn: residents with squared distance > R^2.
     */
    void UpdateVisibleChunks(const glm::vec3& viewerPosition, int viewDistance);

    /**
     * @brief Drain spawn requests into new chunks in the Load state
     */
    void CreateChunks();

    /**
     * @brief Move Load chunks to Generate and push them at the queue front
     *
     * Failed async generations are requeued first. When the queue is full
     * the chunk stays where it is and is retried next tick.
     */
    void LoadChunkData();

    /**
     * @brief Pop at most GetGenerationBudget(R) requests from the queue back
     */
    void GenerateChunks(int viewDistance);

    /**
     * @brief Drain despawn requests, marking chunks Unload
     */
    void PrepareForUnload();

    /**
     * @brief Raise a ChunkReadyEvent for every chunk that reached Done
     */
    void MarkChunksReady();

    /**
     * @brief Destroy every chunk in the Unload state
     */
    void DestroyChunks();

    // =========================================================================
    // Requests and events
    // =========================================================================

    void RequestSpawn(const ChunkCoord& coord);
    void RequestDespawn(const ChunkCoord& coord);

    [[nodiscard]] const std::deque<ChunkSpawnRequest>& GetSpawnRequests() const { return m_spawnRequests; }
    [[nodiscard]] const std::deque<ChunkDespawnRequest>& GetDespawnRequests() const { return m_despawnRequests; }

    /**
     * @brief Take the ready events raised since the last call
     */
    std::vector<ChunkReadyEvent> DrainReadyEvents();

    void SetOnChunkUnloaded(UnloadCallback callback) { m_onChunkUnloaded = std::move(callback); }

    // =========================================================================
    // Queries
    // =========================================================================

    /** @brief Largest chunk coordinate on either axis */
    static constexpr int MAX_CHUNK_COORDINATE = 1 << 24;

    /**
     * @brief Chunk containing a world position
     *
     * Coordinates are clamped to +/-MAX_CHUNK_COORDINATE; NaN maps to 0.
     */
    [[nodiscard]] static ChunkCoord WorldToChunk(const glm::vec3& position);
    [[nodiscard]] static int GetGenerationBudget(int viewDistance);

    [[nodiscard]] const Chunk* GetChunk(const ChunkCoord& coord) const;
    [[nodiscard]] bool IsResident(const ChunkCoord& coord) const { return m_chunks.contains(coord); }
    [[nodiscard]] size_t GetChunkCount() const { return m_chunks.size(); }
    [[nodiscard]] size_t GetPendingGenerationCount() const { return m_generationQueue.size(); }
    [[nodiscard]] size_t GetInFlightCount() const { return m_inFlight.size(); }
    [[nodiscard]] const ChunkMap& GetChunks() const { return m_chunks; }
    [[nodiscard]] ChunkManagerStats GetStats() const;

private:
    struct GenerationRequest {
        ChunkCoord coord{0};
        ChunkHandle handle = 0;
    };

    struct GenerationTask {
        ChunkCoord coord{0};
        ChunkHandle handle = 0;
        VoxelBuffer buffer;
    };

    struct InFlight {
        std::shared_ptr<GenerationTask> task;
        JobHandle job;
    };

    [[nodiscard]] bool UseAsync() const { return m_jobs != nullptr && m_settings.asyncGeneration; }
    Chunk* FindLive(const ChunkCoord& coord, ChunkHandle handle);

    const IChunkGenerator& m_generator;
    ChunkManagerSettings m_settings;
    JobSystem* m_jobs;

    ChunkMap m_chunks;
    ChunkHandle m_nextHandle = 1;

    std::deque<ChunkSpawnRequest> m_spawnRequests;
    std::deque<ChunkDespawnRequest> m_despawnRequests;
    std::deque<GenerationRequest> m_awaitingLoad;        // Load chunks in creation order
    std::deque<GenerationRequest> m_generationQueue;     // push_front / pop_back
    std::deque<GenerationRequest> m_retryRequests;       // Failed async generations
    std::unordered_map<ChunkCoord, InFlight, ChunkCoordHash> m_inFlight;
    std::vector<GenerationRequest> m_justCompleted;
    std::vector<ChunkReadyEvent> m_readyEvents;

    ChunkManagerStats m_stats;
    UnloadCallback m_onChunkUnloaded;
};

} // namespace Lattice
