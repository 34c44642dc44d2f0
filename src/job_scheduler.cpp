#include "job_scheduler.h"

#include <utility>

JobId JobScheduler::submit(JobPriority priority, JobType jobType)
{
    JobId jobId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        jobId = m_nextJobId++;
        m_cancellation.registerJob(jobId);
        m_queue.push(Job{jobId, priority, std::move(jobType)});
        ++m_stats.jobsSubmitted;
    }
    // Waiters use different filters (render vs I/O), so wake them all
    m_jobAvailable.notify_all();
    return jobId;
}

std::optional<Job> JobScheduler::popLocked(const JobPredicate& filter)
{
    return filter ? m_queue.popIf(filter) : m_queue.pop();
}

std::optional<Job> JobScheduler::nextJob()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.pop();
}

std::optional<Job> JobScheduler::nextJobIf(const JobPredicate& filter)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return popLocked(filter);
}

std::optional<Job> JobScheduler::waitForJob(const JobPredicate& filter, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    uint64_t generation = m_wakeGeneration;

    m_jobAvailable.wait_for(lock, timeout, [this, &filter, generation]
                            { return m_wakeGeneration != generation || m_queue.containsMatching(filter); });

    if (m_wakeGeneration != generation)
    {
        return std::nullopt;
    }
    return popLocked(filter);
}

void JobScheduler::shutdownWaiters()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_wakeGeneration;
    }
    m_jobAvailable.notify_all();
}

std::optional<Job> JobScheduler::peekNextJob() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const Job* job = m_queue.peek();
    if (!job)
    {
        return std::nullopt;
    }
    return *job;
}

void JobScheduler::completeJob(JobId jobId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_stats.jobsCompleted;
    m_cancellation.unregister(jobId);
}

bool JobScheduler::cancelJob(JobId jobId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    bool hadToken = m_cancellation.cancel(jobId);

    if (m_queue.remove(jobId))
    {
        ++m_stats.jobsCancelled;
        m_cancellation.unregister(jobId);
        return true;
    }

    // Already running (or unknown): the worker observes the token
    return hadToken;
}

size_t JobScheduler::cancelJobsIf(const JobPredicate& predicate)
{
    if (!predicate)
    {
        return 0;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Job> removed = m_queue.removeIf(predicate);
    if (removed.empty())
    {
        return 0;
    }

    std::vector<JobId> ids;
    ids.reserve(removed.size());
    for (const auto& job : removed)
    {
        ids.push_back(job.id);
    }

    m_cancellation.cancelMany(ids);
    for (JobId jobId : ids)
    {
        m_cancellation.unregister(jobId);
    }
    m_stats.jobsCancelled += removed.size();
    return removed.size();
}

size_t JobScheduler::cancelAllExcept(const JobPredicate& keep)
{
    return cancelJobsIf([&keep](const Job& job) { return !keep || !keep(job); });
}

size_t JobScheduler::cancelPageJobs(uint16_t pageIndex)
{
    return cancelJobsIf(
        [pageIndex](const Job& job)
        {
            std::optional<uint16_t> page = jobPageIndex(job.jobType);
            return page && *page == pageIndex;
        });
}

size_t JobScheduler::cancelOffscreenJobs(const Viewport& viewport, uint32_t tileSize)
{
    PriorityCalculator calculator(viewport, tileSize);

    return cancelJobsIf(
        [&calculator](const Job& job)
        {
            if (const auto* tile = std::get_if<RenderTileJob>(&job.jobType))
            {
                JobPriority priority =
                    calculator.calculateTilePriority({tile->pageIndex, tile->tileX, tile->tileY, tile->zoomLevel});
                return priority != JobPriority::Visible && priority != JobPriority::Margin;
            }
            if (const auto* thumbnail = std::get_if<GenerateThumbnailJob>(&job.jobType))
            {
                JobPriority priority = calculator.calculateThumbnailPriority(thumbnail->pageIndex);
                return priority != JobPriority::Margin && priority != JobPriority::Adjacent;
            }
            // Text work is idle-time only; file loads are never dropped
            return !isLoadFileJob(job.jobType);
        });
}

size_t JobScheduler::cancelAllExceptVisible(const Viewport& viewport, uint32_t tileSize)
{
    PriorityCalculator calculator(viewport, tileSize);

    return cancelJobsIf(
        [&calculator](const Job& job)
        {
            if (const auto* tile = std::get_if<RenderTileJob>(&job.jobType))
            {
                return calculator.calculateTilePriority({tile->pageIndex, tile->tileX, tile->tileY, tile->zoomLevel}) !=
                       JobPriority::Visible;
            }
            return !isLoadFileJob(job.jobType);
        });
}

void JobScheduler::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Job> dropped = m_queue.drain();

    // Running jobs observe their cancelled tokens as well
    m_cancellation.cancelAll();
    m_cancellation.clear();
    m_stats.jobsCancelled += dropped.size();
}

SchedulerStats JobScheduler::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    SchedulerStats snapshot = m_stats;
    snapshot.queueSize = m_queue.size();
    return snapshot;
}

size_t JobScheduler::pendingJobs() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool JobScheduler::hasPendingJobs() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_queue.empty();
}

std::vector<Job> JobScheduler::pendingJobsList() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.snapshot();
}

std::optional<CancellationToken> JobScheduler::getCancellationToken(JobId jobId) const
{
    return m_cancellation.get(jobId);
}
