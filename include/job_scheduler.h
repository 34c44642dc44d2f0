#ifndef JOB_SCHEDULER_H
#define JOB_SCHEDULER_H

#include "cancellation.h"
#include "job.h"
#include "job_queue.h"
#include "viewport_priority.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

struct SchedulerStats
{
    uint64_t jobsSubmitted = 0;
    uint64_t jobsCompleted = 0;
    uint64_t jobsCancelled = 0;
    size_t queueSize = 0;

    uint64_t pendingJobs() const
    {
        uint64_t finished = jobsCompleted + jobsCancelled;
        return jobsSubmitted > finished ? jobsSubmitted - finished : 0;
    }
};

/**
 * @brief Priority job scheduler with cooperative cancellation
 *
 * Jobs are drained strictly by priority (Visible first, Ocr last) and in
 * submission order within a level. One mutex guards the queue and the
 * statistics together so pops and removals are atomic with respect to
 * submissions. Jobs that a worker has already taken are never touched by
 * queue cancellation; only their token is flipped.
 */
class JobScheduler
{
public:
    using JobPredicate = std::function<bool(const Job&)>;

    JobScheduler() = default;
    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    /**
     * Queue a job and register its cancellation token
     * @param priority Priority level
     * @param jobType Work description
     * @return The new job id (monotonic, starting at 1)
     */
    JobId submit(JobPriority priority, JobType jobType);

    std::optional<Job> nextJob();

    /**
     * Pop the highest-priority job accepted by the filter
     * @param filter Null accepts everything
     */
    std::optional<Job> nextJobIf(const JobPredicate& filter);

    /**
     * Block until a job accepted by the filter is available, the timeout
     * expires, or shutdownWaiters() is called
     */
    std::optional<Job> waitForJob(const JobPredicate& filter, std::chrono::milliseconds timeout);

    // Wakes every thread currently blocked in waitForJob without a job
    void shutdownWaiters();

    std::optional<Job> peekNextJob() const;

    void completeJob(JobId jobId);

    /**
     * Cancel a job. A queued job is removed and counted as cancelled; a job
     * that is already running only has its token cancelled.
     * @return true if the job was queued or still had a token
     */
    bool cancelJob(JobId jobId);

    /**
     * Cancel and remove all queued jobs matching the predicate
     * @return Number of jobs removed
     */
    size_t cancelJobsIf(const JobPredicate& predicate);

    size_t cancelAllExcept(const JobPredicate& keep);

    // Every job carrying the page index; LoadFile never matches
    size_t cancelPageJobs(uint16_t pageIndex);

    /**
     * Keep only tiles in the viewport or its margin, thumbnails for the
     * current and neighbouring pages, and file loads
     */
    size_t cancelOffscreenJobs(const Viewport& viewport, uint32_t tileSize);

    // Keep only visible tiles and file loads
    size_t cancelAllExceptVisible(const Viewport& viewport, uint32_t tileSize);

    void clear();

    SchedulerStats stats() const;

    size_t pendingJobs() const;
    bool hasPendingJobs() const;
    std::vector<Job> pendingJobsList() const;

    std::optional<CancellationToken> getCancellationToken(JobId jobId) const;

private:
    std::optional<Job> popLocked(const JobPredicate& filter);

    JobQueue m_queue;
    CancellationRegistry m_cancellation;
    SchedulerStats m_stats;
    JobId m_nextJobId = 1;
    uint64_t m_wakeGeneration = 0;

    mutable std::mutex m_mutex;
    std::condition_variable m_jobAvailable;
};

#endif // JOB_SCHEDULER_H
