/**
 * @file test_job_system.cpp
 * @brief Unit tests for job system
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/JobSystem.hpp"

#include "utils/TestHelpers.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Lattice;
using namespace Lattice::Test;

// =============================================================================
// Job System Tests
// =============================================================================

class JobSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        JobSystemConfig config;
        config.workerThreads = 4;
        ASSERT_TRUE(m_jobs.Initialize(config));
    }

    void TearDown() override {
        m_jobs.Shutdown();
    }

    JobSystem m_jobs;
};

TEST_F(JobSystemTest, IsInitialized) {
    EXPECT_TRUE(m_jobs.IsInitialized());
    EXPECT_EQ(4u, m_jobs.GetWorkerCount());
}

TEST_F(JobSystemTest, SubmitSingleJob) {
    std::atomic<bool> jobRan{false};

    auto handle = m_jobs.Submit([&jobRan]() {
        jobRan = true;
    });

    handle.Wait();

    EXPECT_TRUE(jobRan);
    EXPECT_TRUE(handle.IsComplete());
}

TEST_F(JobSystemTest, SubmitMultipleJobs) {
    std::atomic<int> counter{0};
    std::vector<JobHandle> handles;

    for (int i = 0; i < 100; ++i) {
        handles.push_back(m_jobs.Submit([&counter]() {
            counter++;
        }));
    }

    for (auto& handle : handles) {
        handle.Wait();
    }

    EXPECT_EQ(100, counter);
}

TEST_F(JobSystemTest, JobHandle_InvalidHandle) {
    JobHandle handle;

    EXPECT_FALSE(handle.IsValid());
    EXPECT_TRUE(handle.IsComplete());
    handle.Wait();  // Returns immediately
}

TEST_F(JobSystemTest, ThrowingJobReportsFailure) {
    auto handle = m_jobs.Submit([]() {
        throw std::runtime_error("job failure");
    });

    handle.Wait();
    EXPECT_TRUE(handle.IsComplete());
    EXPECT_EQ(JobStatus::Failed, handle.GetStatus());

    // Workers survive the exception
    std::atomic<bool> ranAfter{false};
    m_jobs.Submit([&ranAfter]() { ranAfter = true; }).Wait();
    EXPECT_TRUE(ranAfter);
}

TEST_F(JobSystemTest, WritesVisibleAfterCompletion) {
    std::vector<int> data(1000, 0);

    auto handle = m_jobs.Submit([&data]() {
        for (size_t i = 0; i < data.size(); ++i) {
            data[i] = static_cast<int>(i);
        }
    });
    handle.Wait();

    for (size_t i = 0; i < data.size(); ++i) {
        ASSERT_EQ(static_cast<int>(i), data[i]);
    }
}

TEST_F(JobSystemTest, JobsRunOnWorkerThreads) {
    std::atomic<bool> onWorker{false};
    JobSystem* jobs = &m_jobs;

    m_jobs.Submit([&onWorker, jobs]() {
        onWorker = jobs->IsWorkerThread();
    }).Wait();

    EXPECT_TRUE(onWorker);
    EXPECT_FALSE(m_jobs.IsWorkerThread());
}

TEST(JobSystemUninitializedTest, SubmitRunsInline) {
    JobSystem jobs;
    bool ran = false;

    auto handle = jobs.Submit([&ran]() { ran = true; });

    EXPECT_TRUE(ran);
    EXPECT_TRUE(handle.IsComplete());
    EXPECT_TRUE(handle.IsValid());
}

TEST(JobSystemUninitializedTest, ShutdownWithoutInitialize) {
    JobSystem jobs;
    jobs.Shutdown();
    EXPECT_FALSE(jobs.IsInitialized());
}

TEST_F(JobSystemTest, JobsStartInSubmissionOrder) {
    JobSystem single;
    JobSystemConfig config;
    config.workerThreads = 1;
    ASSERT_TRUE(single.Initialize(config));

    std::mutex orderMutex;
    std::vector<int> order;
    std::vector<JobHandle> handles;
    for (int i = 0; i < 8; ++i) {
        handles.push_back(single.Submit([i, &order, &orderMutex]() {
            std::lock_guard lock(orderMutex);
            order.push_back(i);
        }));
    }
    for (const auto& handle : handles) {
        handle.Wait();
    }

    EXPECT_THAT(order, ::testing::ElementsAre(0, 1, 2, 3, 4, 5, 6, 7));
}

TEST(JobSystemShutdownTest, QueuedJobsCancelled) {
    JobSystem jobs;
    JobSystemConfig config;
    config.workerThreads = 1;
    ASSERT_TRUE(jobs.Initialize(config));

    std::atomic<bool> release{false};
    std::atomic<bool> started{false};
    JobHandle blocker = jobs.Submit([&release, &started]() {
        started = true;
        while (!release.load()) {
            std::this_thread::yield();
        }
    });
    ASSERT_TRUE(WaitUntil([&started] { return started.load(); }, [] {}));

    std::atomic<bool> queuedRan{false};
    JobHandle queued = jobs.Submit([&queuedRan]() { queuedRan = true; });
    EXPECT_EQ(1u, jobs.GetPendingJobCount());

    std::thread releaser([&release]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        release = true;
    });
    jobs.Shutdown();
    releaser.join();

    EXPECT_EQ(JobStatus::Succeeded, blocker.GetStatus());
    EXPECT_EQ(JobStatus::Cancelled, queued.GetStatus());
    EXPECT_FALSE(queuedRan);
    queued.Wait();
}

TEST(JobStatusTest, ToString) {
    EXPECT_STREQ("Cancelled", JobStatusToString(JobStatus::Cancelled));
    EXPECT_STREQ("Failed", JobStatusToString(JobStatus::Failed));
}
