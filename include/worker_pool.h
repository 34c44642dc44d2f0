#ifndef WORKER_POOL_H
#define WORKER_POOL_H

#include "cancellation.h"
#include "job.h"
#include "job_scheduler.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using JobExecutor = std::function<void(const Job&, const CancellationToken&)>;

struct WorkerPoolConfig
{
    size_t numWorkers = 0; // 0 means std::thread::hardware_concurrency()
    std::chrono::milliseconds pollInterval{100};
    std::string name = "render-worker";
    JobScheduler::JobPredicate jobFilter; // Null accepts every job

    static WorkerPoolConfig renderPool(size_t workers);
    static WorkerPoolConfig ioThread();
};

struct WorkerPoolStats
{
    uint64_t jobsExecuted = 0;
    uint64_t jobsSkipped = 0; // Token was already cancelled when popped
    uint64_t executorErrors = 0;
};

/**
 * @brief Pool of threads that pull jobs from a JobScheduler
 *
 * Each worker blocks in waitForJob, runs the executor unless the job's token
 * is already cancelled, and always reports the job complete. An exception
 * thrown by the executor is logged and counted; the worker keeps running.
 */
class WorkerPool
{
public:
    WorkerPool(JobScheduler& scheduler, JobExecutor executor, WorkerPoolConfig config = WorkerPoolConfig());
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * Stop every worker and join the threads. Jobs still queued stay in the
     * scheduler; a running executor is allowed to finish.
     */
    void shutdown();

    size_t numWorkers() const
    {
        return m_threads.size();
    }

    bool isShuttingDown() const
    {
        return !m_running.load(std::memory_order_acquire);
    }

    const std::string& getName() const
    {
        return m_config.name;
    }

    WorkerPoolStats stats() const;

private:
    void workerLoop(size_t workerIndex);

    JobScheduler& m_scheduler;
    JobExecutor m_executor;
    WorkerPoolConfig m_config;
    std::vector<std::thread> m_threads;
    std::atomic<bool> m_running{false};

    std::atomic<uint64_t> m_jobsExecuted{0};
    std::atomic<uint64_t> m_jobsSkipped{0};
    std::atomic<uint64_t> m_executorErrors{0};
};

#endif // WORKER_POOL_H
