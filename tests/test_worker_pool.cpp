#include "test_support.h"
#include "worker_pool.h"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>

namespace
{
RenderTileJob tileJob(uint16_t page)
{
    return RenderTileJob{page, 0, 0, 100, 0, false};
}

WorkerPoolConfig fastConfig(size_t workers)
{
    WorkerPoolConfig config = WorkerPoolConfig::renderPool(workers);
    config.pollInterval = std::chrono::milliseconds(5);
    return config;
}
} // namespace

TEST(WorkerPool, ExecutesEverySubmittedJob)
{
    JobScheduler scheduler;
    std::mutex mutex;
    std::set<JobId> executed;

    WorkerPool pool(
        scheduler,
        [&](const Job& job, const CancellationToken&)
        {
            std::lock_guard<std::mutex> lock(mutex);
            executed.insert(job.id);
        },
        fastConfig(3));
    EXPECT_EQ(pool.numWorkers(), 3u);

    for (uint16_t page = 0; page < 50; ++page)
    {
        scheduler.submit(JobPriority::Visible, tileJob(page));
    }

    ASSERT_TRUE(waitFor([&] { return scheduler.stats().pendingJobs() == 0; }));
    pool.shutdown();

    EXPECT_EQ(executed.size(), 50u);
    EXPECT_EQ(pool.stats().jobsExecuted, 50u);
    EXPECT_EQ(scheduler.stats().jobsCompleted, 50u);
}

TEST(WorkerPool, SkipsJobsCancelledBeforeExecution)
{
    JobScheduler scheduler;
    JobId id = scheduler.submit(JobPriority::Visible, tileJob(0));
    // Token flipped while the job is still queued, as a racing canceller would
    scheduler.getCancellationToken(id)->cancel();

    std::atomic<int> executed{0};
    WorkerPool pool(
        scheduler, [&](const Job&, const CancellationToken&) { ++executed; }, fastConfig(1));

    ASSERT_TRUE(waitFor([&] { return pool.stats().jobsSkipped == 1; }));
    pool.shutdown();

    EXPECT_EQ(executed.load(), 0);
    EXPECT_EQ(scheduler.stats().pendingJobs(), 0u);
}

TEST(WorkerPool, ExecutorExceptionsAreCountedAndWorkerSurvives)
{
    JobScheduler scheduler;
    std::atomic<int> succeeded{0};

    WorkerPool pool(
        scheduler,
        [&](const Job& job, const CancellationToken&)
        {
            if (jobPageIndex(job.jobType) == 0)
            {
                throw std::runtime_error("render failed");
            }
            ++succeeded;
        },
        fastConfig(1));

    scheduler.submit(JobPriority::Visible, tileJob(0));
    scheduler.submit(JobPriority::Visible, tileJob(1));

    ASSERT_TRUE(waitFor([&] { return scheduler.stats().pendingJobs() == 0; }));
    pool.shutdown();

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(pool.stats().executorErrors, 1u);
    EXPECT_EQ(scheduler.stats().jobsCompleted, 2u);
}

TEST(WorkerPool, RunningJobObservesCancellation)
{
    JobScheduler scheduler;
    std::atomic<bool> started{false};
    std::atomic<bool> sawCancel{false};

    WorkerPool pool(
        scheduler,
        [&](const Job&, const CancellationToken& token)
        {
            started = true;
            sawCancel = waitFor([&] { return token.isCancelled(); });
        },
        fastConfig(1));

    JobId id = scheduler.submit(JobPriority::Visible, tileJob(0));
    ASSERT_TRUE(waitFor([&] { return started.load(); }));
    EXPECT_TRUE(scheduler.cancelJob(id));

    ASSERT_TRUE(waitFor([&] { return scheduler.stats().pendingJobs() == 0; }));
    pool.shutdown();
    EXPECT_TRUE(sawCancel.load());
}

TEST(WorkerPool, IoThreadOnlyTakesLoadFileJobs)
{
    JobScheduler scheduler;
    std::atomic<int> loads{0};
    std::atomic<int> others{0};

    WorkerPoolConfig config = WorkerPoolConfig::ioThread();
    config.pollInterval = std::chrono::milliseconds(5);
    WorkerPool io(
        scheduler,
        [&](const Job& job, const CancellationToken&)
        {
            if (isLoadFileJob(job.jobType))
            {
                ++loads;
            }
            else
            {
                ++others;
            }
        },
        config);
    EXPECT_EQ(io.numWorkers(), 1u);

    scheduler.submit(JobPriority::Visible, tileJob(0));
    scheduler.submit(JobPriority::Ocr, LoadFileJob{"a.pdf"});

    ASSERT_TRUE(waitFor([&] { return loads.load() == 1; }));
    io.shutdown();

    EXPECT_EQ(others.load(), 0);
    EXPECT_EQ(scheduler.pendingJobs(), 1u);
}

TEST(WorkerPool, ShutdownIsIdempotent)
{
    JobScheduler scheduler;
    WorkerPool pool(
        scheduler, [](const Job&, const CancellationToken&) {}, fastConfig(2));

    pool.shutdown();
    EXPECT_TRUE(pool.isShuttingDown());
    pool.shutdown();
    EXPECT_EQ(pool.numWorkers(), 0u);
}

TEST(WorkerPool, RejectsEmptyExecutor)
{
    JobScheduler scheduler;
    EXPECT_THROW({ WorkerPool pool(scheduler, JobExecutor(), fastConfig(1)); }, std::invalid_argument);
}
