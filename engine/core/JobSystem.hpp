#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Lattice {

/**
 * @brief Outcome of a submitted job
 */
enum class JobStatus : uint8_t {
    Pending,        // Queued or running
    Succeeded,
    Failed,         // The job threw
    Cancelled       // Dropped by Shutdown before it started
};

[[nodiscard]] const char* JobStatusToString(JobStatus status);

struct JobSystemConfig {
    uint32_t workerThreads = 0;  // 0 = auto (hardware_concurrency - 1)
    std::string threadNamePrefix = "Lattice_Gen_";
};

/**
 * @brief Shared view of one job's status
 *
 * The status is published with release semantics: a thread that observes
 * IsComplete() also observes every write the job made.
 */
class JobHandle {
public:
    JobHandle() = default;
    explicit JobHandle(std::shared_ptr<std::atomic<JobStatus>> status)
        : m_status(std::move(status)) {}

    /** @brief Status of the job; an empty handle reads as Succeeded */
    [[nodiscard]] JobStatus GetStatus() const {
        return m_status ? m_status->load(std::memory_order_acquire) : JobStatus::Succeeded;
    }

    [[nodiscard]] bool IsComplete() const { return GetStatus() != JobStatus::Pending; }
    [[nodiscard]] bool Succeeded() const { return GetStatus() == JobStatus::Succeeded; }

    /**
     * @brief Block until the job leaves Pending
     */
    void Wait() const {
        while (!IsComplete()) {
            std::this_thread::yield();
        }
    }

    [[nodiscard]] bool IsValid() const { return m_status != nullptr; }

private:
    std::shared_ptr<std::atomic<JobStatus>> m_status;
};

/**
 * @brief Fixed pool of worker threads draining a FIFO job queue
 *
 * Used for off-thread chunk generation. Jobs run in submission order
 * (the chunk manager has already ordered them nearest first). Without
 * workers, Submit runs the job inline.
 */
class JobSystem {
public:
    using Job = std::function<void()>;

    JobSystem() = default;
    ~JobSystem();

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;
    JobSystem(JobSystem&&) = delete;
    JobSystem& operator=(JobSystem&&) = delete;

    /**
     * @brief Start the worker threads
     * @return true on success
     */
    bool Initialize(const JobSystemConfig& config = {});

    /**
     * @brief Let running jobs finish, cancel queued ones, join the workers
     */
    void Shutdown();

    [[nodiscard]] bool IsInitialized() const { return m_initialized; }

    /**
     * @brief Queue a job
     * @return Handle to observe its status
     */
    [[nodiscard]] JobHandle Submit(Job job);

    [[nodiscard]] uint32_t GetWorkerCount() const { return m_workerCount; }

    [[nodiscard]] size_t GetPendingJobCount() const;

    [[nodiscard]] bool IsWorkerThread() const;

private:
    struct QueuedJob {
        Job job;
        std::shared_ptr<std::atomic<JobStatus>> status;
    };

    void WorkerLoop();
    static void Execute(QueuedJob& job);

    std::vector<std::thread> m_workers;
    uint32_t m_workerCount = 0;

    std::deque<QueuedJob> m_queue;
    mutable std::mutex m_queueMutex;
    std::condition_variable m_condition;

    bool m_running = false;         // Guarded by m_queueMutex
    bool m_initialized = false;

    thread_local static bool s_isWorkerThread;
};

} // namespace Lattice
