#include "worker_pool.h"

#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

WorkerPoolConfig WorkerPoolConfig::renderPool(size_t workers)
{
    WorkerPoolConfig config;
    config.numWorkers = workers;
    config.name = "render-worker";
    config.jobFilter = [](const Job& job) { return !isLoadFileJob(job.jobType); };
    return config;
}

WorkerPoolConfig WorkerPoolConfig::ioThread()
{
    WorkerPoolConfig config;
    config.numWorkers = 1;
    config.name = "io-thread";
    config.jobFilter = [](const Job& job) { return isLoadFileJob(job.jobType); };
    return config;
}

WorkerPool::WorkerPool(JobScheduler& scheduler, JobExecutor executor, WorkerPoolConfig config)
    : m_scheduler(scheduler), m_executor(std::move(executor)), m_config(std::move(config))
{
    if (!m_executor)
    {
        throw std::invalid_argument("WorkerPool executor cannot be empty");
    }

    size_t workers = m_config.numWorkers;
    if (workers == 0)
    {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }

    m_running = true;
    m_threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i)
    {
        m_threads.emplace_back(&WorkerPool::workerLoop, this, i);
    }

    std::cout << "WorkerPool: Started " << workers << " " << m_config.name << " thread(s)" << std::endl;
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

void WorkerPool::shutdown()
{
    if (!m_running.exchange(false))
    {
        return;
    }

    m_scheduler.shutdownWaiters();

    for (auto& thread : m_threads)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }
    m_threads.clear();

    std::cout << "WorkerPool: Stopped " << m_config.name << " threads" << std::endl;
}

WorkerPoolStats WorkerPool::stats() const
{
    WorkerPoolStats snapshot;
    snapshot.jobsExecuted = m_jobsExecuted.load();
    snapshot.jobsSkipped = m_jobsSkipped.load();
    snapshot.executorErrors = m_executorErrors.load();
    return snapshot;
}

void WorkerPool::workerLoop(size_t workerIndex)
{
    while (m_running.load(std::memory_order_acquire))
    {
        std::optional<Job> job = m_scheduler.waitForJob(m_config.jobFilter, m_config.pollInterval);
        if (!job)
        {
            continue;
        }

        // A popped job without a token was swept by JobScheduler::clear()
        std::optional<CancellationToken> token = m_scheduler.getCancellationToken(job->id);
        if (!token || token->isCancelled())
        {
            ++m_jobsSkipped;
            m_scheduler.completeJob(job->id);
            continue;
        }

        try
        {
            m_executor(*job, *token);
            ++m_jobsExecuted;
        }
        catch (const std::exception& e)
        {
            ++m_executorErrors;
            std::cerr << "WorkerPool: " << m_config.name << "-" << workerIndex << " failed "
                      << describeJobType(job->jobType) << ": " << e.what() << std::endl;
        }

        m_scheduler.completeJob(job->id);
    }
}
