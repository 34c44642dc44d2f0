#ifndef JOB_QUEUE_H
#define JOB_QUEUE_H

#include "job.h"

#include <array>
#include <deque>
#include <functional>
#include <optional>
#include <vector>

/**
 * @brief Strict-priority queue with one FIFO sub-queue per priority level
 *
 * Not thread-safe on its own; JobScheduler guards it together with its
 * statistics under a single mutex.
 */
class JobQueue
{
public:
    using JobFilter = std::function<bool(const Job&)>;

    void push(Job job);

    // Oldest job of the highest non-empty level
    std::optional<Job> pop();

    // Highest-priority job satisfying the filter, FIFO within a level
    std::optional<Job> popIf(const JobFilter& filter);

    const Job* peek() const;

    bool remove(JobId jobId);

    /**
     * Remove every queued job matching the predicate
     * @return The removed jobs in priority order
     */
    std::vector<Job> removeIf(const JobFilter& predicate);

    std::vector<Job> drain();
    std::vector<Job> snapshot() const;

    bool containsMatching(const JobFilter& filter) const;

    size_t size() const
    {
        return m_size;
    }

    bool empty() const
    {
        return m_size == 0;
    }

private:
    static size_t levelIndex(JobPriority priority)
    {
        return static_cast<size_t>(priority);
    }

    std::array<std::deque<Job>, JOB_PRIORITY_LEVELS> m_levels;
    size_t m_size = 0;
};

#endif // JOB_QUEUE_H
