#include "terrain/ChunkManager.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Lattice {

ChunkManager::ChunkManager(const IChunkGenerator& generator, ChunkManagerSettings settings, JobSystem* jobs)
    : m_generator(generator)
    , m_settings(settings)
    , m_jobs(jobs) {
    if (m_settings.asyncGeneration && !m_jobs) {
        LATTICE_LOG_WARN("ChunkManager: async generation requested without a job system, generating inline");
    }
}

ChunkManager::~ChunkManager() {
    // Running tasks reference the generator; let them finish before it can go away
    if (m_jobs && m_jobs->IsInitialized()) {
        for (auto& [coord, inFlight] : m_inFlight) {
            inFlight.job.Wait();
        }
    }
}

void ChunkManager::Tick(const glm::vec3& viewerPosition, int viewDistance) {
    CompleteAsyncGeneration();
    UpdateVisibleChunks(viewerPosition, viewDistance);
    CreateChunks();
    LoadChunkData();
    GenerateChunks(viewDistance);
    PrepareForUnload();
    MarkChunksReady();
    DestroyChunks();
}

// ============================================================================
// Stages
// ============================================================================

void ChunkManager::CompleteAsyncGeneration() {
    for (auto it = m_inFlight.begin(); it != m_inFlight.end();) {
        if (!it->second.job.IsComplete()) {
            ++it;
            continue;
        }

        const JobStatus status = it->second.job.GetStatus();
        std::shared_ptr<GenerationTask> task = std::move(it->second.task);
        it = m_inFlight.erase(it);

        Chunk* chunk = FindLive(task->coord, task->handle);
        if (!chunk || chunk->GetState() != ChunkLoadState::Generate) {
            ++m_stats.resultsDiscarded;
            LATTICE_LOG_TRACE("ChunkManager: discarded result for ({}, {})", task->coord.x, task->coord.y);
            continue;
        }

        if (status != JobStatus::Succeeded) {
            // Requeued by LoadChunkData, subject to the queue bound
            ++m_stats.generationRetries;
            LATTICE_LOG_WARN("ChunkManager: generation of ({}, {}) {}, retrying", task->coord.x, task->coord.y,
                             JobStatusToString(status));
            m_retryRequests.push_back(GenerationRequest{task->coord, task->handle});
            continue;
        }

        chunk->SwapVoxels(task->buffer);
        chunk->TransitionTo(ChunkLoadState::Done);
        m_justCompleted.push_back(GenerationRequest{task->coord, task->handle});
        ++m_stats.chunksGenerated;
    }
}

void ChunkManager::UpdateVisibleChunks(const glm::vec3& viewerPosition, int viewDistance) {
    const int radius = std::max(0, viewDistance);
    const int radiusSq = radius * radius;
    const ChunkCoord center = WorldToChunk(viewerPosition);

    struct Candidate {
        int distanceSq;
        ChunkCoord coord;
    };
    std::vector<Candidate> candidates;

    for (int dx = -radius; dx <= radius; ++dx) {
        for (int dy = -radius; dy <= radius; ++dy) {
            const int distanceSq = dx * dx + dy * dy;
            if (distanceSq >= radiusSq) {
                continue;
            }
            ChunkCoord coord = center + ChunkCoord(dx, dy);
            if (!m_chunks.contains(coord)) {
                candidates.push_back(Candidate{distanceSq, coord});
            }
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) { return a.distanceSq < b.distanceSq; });

    for (const Candidate& candidate : candidates) {
        m_spawnRequests.push_back(ChunkSpawnRequest{candidate.coord});
    }

    for (const auto& [coord, chunk] : m_chunks) {
        const int64_t deltaX = static_cast<int64_t>(coord.x) - center.x;
        const int64_t deltaY = static_cast<int64_t>(coord.y) - center.y;
        if (deltaX * deltaX + deltaY * deltaY > radiusSq) {
            m_despawnRequests.push_back(ChunkDespawnRequest{coord, chunk->GetHandle()});
        }
    }
}

void ChunkManager::CreateChunks() {
    while (!m_spawnRequests.empty()) {
        ChunkSpawnRequest request = m_spawnRequests.front();
        m_spawnRequests.pop_front();

        if (m_chunks.contains(request.coord)) {
            continue;
        }

        const ChunkHandle handle = m_nextHandle++;
        m_chunks.emplace(request.coord, std::make_unique<Chunk>(request.coord, handle));
        m_awaitingLoad.push_back(GenerationRequest{request.coord, handle});
        ++m_stats.chunksSpawned;
    }
}

void ChunkManager::LoadChunkData() {
    // Failed generations go first, at the back so they are popped next
    std::deque<GenerationRequest> failed;
    while (!m_retryRequests.empty()) {
        GenerationRequest request = m_retryRequests.front();
        m_retryRequests.pop_front();

        Chunk* chunk = FindLive(request.coord, request.handle);
        if (!chunk || chunk->GetState() != ChunkLoadState::Generate) {
            continue;
        }
        if (m_generationQueue.size() >= m_settings.maxPendingGeneration) {
            failed.push_back(request);
            continue;
        }
        m_generationQueue.push_back(request);
    }
    m_retryRequests = std::move(failed);

    std::deque<GenerationRequest> retry;

    while (!m_awaitingLoad.empty()) {
        GenerationRequest request = m_awaitingLoad.front();
        m_awaitingLoad.pop_front();

        Chunk* chunk = FindLive(request.coord, request.handle);
        if (!chunk || chunk->GetState() != ChunkLoadState::Load) {
            continue;
        }

        if (m_generationQueue.size() >= m_settings.maxPendingGeneration) {
            retry.push_back(request);
            continue;
        }

        chunk->TransitionTo(ChunkLoadState::Generate);
        m_generationQueue.push_front(request);
    }

    m_awaitingLoad = std::move(retry);
}

void ChunkManager::GenerateChunks(int viewDistance) {
    const int budget = GetGenerationBudget(viewDistance);
    std::vector<GenerationRequest> deferred;

    for (int i = 0; i < budget && !m_generationQueue.empty(); ++i) {
        GenerationRequest request = m_generationQueue.back();
        m_generationQueue.pop_back();

        Chunk* chunk = FindLive(request.coord, request.handle);
        if (!chunk || chunk->GetState() != ChunkLoadState::Generate) {
            ++m_stats.staleRequestsSkipped;
            continue;
        }

        if (UseAsync()) {
            if (m_inFlight.contains(request.coord)) {
                // A discarded task for an earlier chunk at this coordinate is still running
                deferred.push_back(request);
                continue;
            }

            auto task = std::make_shared<GenerationTask>();
            task->coord = request.coord;
            task->handle = request.handle;

            const IChunkGenerator& generator = m_generator;
            JobHandle job = m_jobs->Submit([task, &generator]() {
                generator.Generate(task->coord, task->buffer);
            });
            m_inFlight.emplace(request.coord, InFlight{std::move(task), std::move(job)});
            continue;
        }

        m_generator.Generate(chunk->GetCoord(), chunk->GetVoxels());
        chunk->TransitionTo(ChunkLoadState::Done);
        m_justCompleted.push_back(request);
        ++m_stats.chunksGenerated;
    }

    // Deferred requests return to the back in their original pop order
    for (auto it = deferred.rbegin(); it != deferred.rend(); ++it) {
        m_generationQueue.push_back(*it);
    }
}

void ChunkManager::PrepareForUnload() {
    while (!m_despawnRequests.empty()) {
        ChunkDespawnRequest request = m_despawnRequests.front();
        m_despawnRequests.pop_front();

        if (Chunk* chunk = FindLive(request.coord, request.handle)) {
            chunk->TransitionTo(ChunkLoadState::Unload);
        }
    }
}

void ChunkManager::MarkChunksReady() {
    for (const GenerationRequest& completed : m_justCompleted) {
        Chunk* chunk = FindLive(completed.coord, completed.handle);
        if (chunk && chunk->GetState() == ChunkLoadState::Done) {
            m_readyEvents.push_back(ChunkReadyEvent{completed.coord, completed.handle});
        }
    }
    m_justCompleted.clear();
}

void ChunkManager::DestroyChunks() {
    for (auto it = m_chunks.begin(); it != m_chunks.end();) {
        if (it->second->GetState() != ChunkLoadState::Unload) {
            ++it;
            continue;
        }

        const ChunkCoord coord = it->first;
        it = m_chunks.erase(it);
        ++m_stats.chunksDestroyed;

        if (m_onChunkUnloaded) {
            m_onChunkUnloaded(coord);
        }
    }
}

// ============================================================================
// Requests and events
// ============================================================================

void ChunkManager::RequestSpawn(const ChunkCoord& coord) {
    m_spawnRequests.push_back(ChunkSpawnRequest{coord});
}

void ChunkManager::RequestDespawn(const ChunkCoord& coord) {
    auto it = m_chunks.find(coord);
    if (it != m_chunks.end()) {
        m_despawnRequests.push_back(ChunkDespawnRequest{coord, it->second->GetHandle()});
    }
}

std::vector<ChunkReadyEvent> ChunkManager::DrainReadyEvents() {
    std::vector<ChunkReadyEvent> events;
    events.swap(m_readyEvents);
    return events;
}

// ============================================================================
// Queries
// ============================================================================

namespace {

int ToChunkAxis(float world, int chunkSize) {
    if (std::isnan(world)) {
        return 0;
    }
    const double chunk = std::floor(static_cast<double>(world) / chunkSize);
    return static_cast<int>(std::clamp(chunk, -static_cast<double>(ChunkManager::MAX_CHUNK_COORDINATE),
                                       static_cast<double>(ChunkManager::MAX_CHUNK_COORDINATE)));
}

} // namespace

ChunkCoord ChunkManager::WorldToChunk(const glm::vec3& position) {
    return ChunkCoord(ToChunkAxis(position.x, CHUNK_WIDTH), ToChunkAxis(position.z, CHUNK_DEPTH));
}

int ChunkManager::GetGenerationBudget(int viewDistance) {
    return std::max(1, viewDistance / 2);
}

const Chunk* ChunkManager::GetChunk(const ChunkCoord& coord) const {
    auto it = m_chunks.find(coord);
    return it == m_chunks.end() ? nullptr : it->second.get();
}

ChunkManagerStats ChunkManager::GetStats() const {
    ChunkManagerStats stats = m_stats;
    stats.residentChunks = m_chunks.size();
    stats.pendingGeneration = m_generationQueue.size();
    stats.inFlightGeneration = m_inFlight.size();
    return stats;
}

Chunk* ChunkManager::FindLive(const ChunkCoord& coord, ChunkHandle handle) {
    auto it = m_chunks.find(coord);
    if (it == m_chunks.end() || it->second->GetHandle() != handle) {
        return nullptr;
    }
    return it->second.get();
}

} // namespace Lattice
