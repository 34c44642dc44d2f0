#include "job_queue.h"

#include <algorithm>
#include <utility>

void JobQueue::push(Job job)
{
    m_levels[levelIndex(job.priority)].push_back(std::move(job));
    ++m_size;
}

std::optional<Job> JobQueue::pop()
{
    for (auto& level : m_levels)
    {
        if (!level.empty())
        {
            Job job = std::move(level.front());
            level.pop_front();
            --m_size;
            return job;
        }
    }
    return std::nullopt;
}

std::optional<Job> JobQueue::popIf(const JobFilter& filter)
{
    if (!filter)
    {
        return pop();
    }

    for (auto& level : m_levels)
    {
        auto it = std::find_if(level.begin(), level.end(), filter);
        if (it != level.end())
        {
            Job job = std::move(*it);
            level.erase(it);
            --m_size;
            return job;
        }
    }
    return std::nullopt;
}

const Job* JobQueue::peek() const
{
    for (const auto& level : m_levels)
    {
        if (!level.empty())
        {
            return &level.front();
        }
    }
    return nullptr;
}

bool JobQueue::remove(JobId jobId)
{
    for (auto& level : m_levels)
    {
        auto it = std::find_if(level.begin(), level.end(), [jobId](const Job& job) { return job.id == jobId; });
        if (it != level.end())
        {
            level.erase(it);
            --m_size;
            return true;
        }
    }
    return false;
}

std::vector<Job> JobQueue::removeIf(const JobFilter& predicate)
{
    std::vector<Job> removed;
    for (auto& level : m_levels)
    {
        auto keepEnd = std::stable_partition(level.begin(), level.end(),
                                             [&predicate](const Job& job) { return !predicate(job); });
        for (auto it = keepEnd; it != level.end(); ++it)
        {
            removed.push_back(std::move(*it));
        }
        level.erase(keepEnd, level.end());
    }
    m_size -= removed.size();
    return removed;
}

std::vector<Job> JobQueue::drain()
{
    std::vector<Job> drained;
    drained.reserve(m_size);
    for (auto& level : m_levels)
    {
        for (auto& job : level)
        {
            drained.push_back(std::move(job));
        }
        level.clear();
    }
    m_size = 0;
    return drained;
}

std::vector<Job> JobQueue::snapshot() const
{
    std::vector<Job> jobs;
    jobs.reserve(m_size);
    for (const auto& level : m_levels)
    {
        jobs.insert(jobs.end(), level.begin(), level.end());
    }
    return jobs;
}

bool JobQueue::containsMatching(const JobFilter& filter) const
{
    for (const auto& level : m_levels)
    {
        if (!filter)
        {
            if (!level.empty())
            {
                return true;
            }
            continue;
        }
        if (std::any_of(level.begin(), level.end(), filter))
        {
            return true;
        }
    }
    return false;
}
