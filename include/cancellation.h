#ifndef CANCELLATION_H
#define CANCELLATION_H

#include "job.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

/**
 * @brief Cooperative cancellation flag shared between a job and its owner
 *
 * Copies of a token share the same flag, so cancelling any copy is observed by
 * every other copy. Workers are expected to poll isCancelled() during long
 * renders; nothing here preempts a running job.
 */
class CancellationToken
{
public:
    CancellationToken();

    void cancel();
    bool isCancelled() const;

    // Reopens the flag for every copy of this token
    void reset();

    bool sharesStateWith(const CancellationToken& other) const
    {
        return m_cancelled == other.m_cancelled;
    }

private:
    std::shared_ptr<std::atomic<bool>> m_cancelled;
};

/**
 * @brief Maps job ids to their cancellation tokens
 */
class CancellationRegistry
{
public:
    CancellationRegistry() = default;

    /**
     * Create and store a fresh token for a job
     * @param jobId The job to register
     * @return The token (shares state with the stored copy)
     */
    CancellationToken registerJob(JobId jobId);

    /**
     * Cancel the token of a registered job
     * @return true if the job was registered
     */
    bool cancel(JobId jobId);

    /**
     * @return Number of ids that had a registered token
     */
    size_t cancelMany(const std::vector<JobId>& jobIds);

    size_t cancelAll();
    bool unregister(JobId jobId);
    std::optional<CancellationToken> get(JobId jobId) const;

    size_t size() const;
    bool empty() const;
    void clear();

private:
    std::unordered_map<JobId, CancellationToken> m_tokens;
    mutable std::mutex m_mutex;
};

#endif // CANCELLATION_H
