#include "core/JobSystem.hpp"
#include "core/Logger.hpp"

#include <algorithm>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace Lattice {

thread_local bool JobSystem::s_isWorkerThread = false;

const char* JobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:   return "Pending";
        case JobStatus::Succeeded: return "Succeeded";
        case JobStatus::Failed:    return "Failed";
        case JobStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

JobSystem::~JobSystem() {
    Shutdown();
}

bool JobSystem::Initialize(const JobSystemConfig& config) {
    if (m_initialized) {
        LATTICE_LOG_WARN("JobSystem already initialized");
        return true;
    }

    uint32_t hardwareThreads = std::thread::hardware_concurrency();
    m_workerCount = config.workerThreads > 0
        ? config.workerThreads
        : std::max(1u, hardwareThreads > 1 ? hardwareThreads - 1 : 1u);

    LATTICE_LOG_INFO("Starting {} generation workers", m_workerCount);

    {
        std::lock_guard lock(m_queueMutex);
        m_running = true;
    }

    m_workers.reserve(m_workerCount);
    for (uint32_t i = 0; i < m_workerCount; ++i) {
        m_workers.emplace_back(&JobSystem::WorkerLoop, this);

#if defined(__linux__)
        // Linux limits thread names to 15 characters
        std::string name = (config.threadNamePrefix + std::to_string(i)).substr(0, 15);
        pthread_setname_np(m_workers.back().native_handle(), name.c_str());
#endif
    }

    m_initialized = true;
    return true;
}

void JobSystem::Shutdown() {
    if (!m_initialized) {
        return;
    }

    std::deque<QueuedJob> cancelled;
    {
        std::lock_guard lock(m_queueMutex);
        m_running = false;
        cancelled.swap(m_queue);
    }
    m_condition.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
    m_workerCount = 0;

    for (auto& job : cancelled) {
        job.status->store(JobStatus::Cancelled, std::memory_order_release);
    }
    if (!cancelled.empty()) {
        LATTICE_LOG_DEBUG("JobSystem cancelled {} queued jobs", cancelled.size());
    }

    m_initialized = false;
    LATTICE_LOG_INFO("Generation workers stopped");
}

JobHandle JobSystem::Submit(Job job) {
    QueuedJob queued{std::move(job), std::make_shared<std::atomic<JobStatus>>(JobStatus::Pending)};
    JobHandle handle(queued.status);

    if (!m_initialized) {
        Execute(queued);
        return handle;
    }

    {
        std::lock_guard lock(m_queueMutex);
        m_queue.push_back(std::move(queued));
    }
    m_condition.notify_one();
    return handle;
}

size_t JobSystem::GetPendingJobCount() const {
    std::lock_guard lock(m_queueMutex);
    return m_queue.size();
}

bool JobSystem::IsWorkerThread() const {
    return s_isWorkerThread;
}

void JobSystem::WorkerLoop() {
    s_isWorkerThread = true;

    while (true) {
        QueuedJob job;
        {
            std::unique_lock lock(m_queueMutex);
            m_condition.wait(lock, [this] { return !m_queue.empty() || !m_running; });
            if (!m_running) {
                break;
            }
            job = std::move(m_queue.front());
            m_queue.pop_front();
        }

        Execute(job);
    }

    s_isWorkerThread = false;
}

void JobSystem::Execute(QueuedJob& job) {
    JobStatus result = JobStatus::Succeeded;
    try {
        job.job();
    } catch (const std::exception& e) {
        LATTICE_LOG_ERROR("Job failed: {}", e.what());
        result = JobStatus::Failed;
    }
    job.status->store(result, std::memory_order_release);
}

} // namespace Lattice
