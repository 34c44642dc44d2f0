#include "cancellation.h"

CancellationToken::CancellationToken()
    : m_cancelled(std::make_shared<std::atomic<bool>>(false))
{
}

void CancellationToken::cancel()
{
    m_cancelled->store(true, std::memory_order_release);
}

bool CancellationToken::isCancelled() const
{
    return m_cancelled->load(std::memory_order_acquire);
}

void CancellationToken::reset()
{
    m_cancelled->store(false, std::memory_order_release);
}

CancellationToken CancellationRegistry::registerJob(JobId jobId)
{
    CancellationToken token;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tokens[jobId] = token;
    return token;
}

bool CancellationRegistry::cancel(JobId jobId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tokens.find(jobId);
    if (it == m_tokens.end())
    {
        return false;
    }

    it->second.cancel();
    return true;
}

size_t CancellationRegistry::cancelMany(const std::vector<JobId>& jobIds)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t cancelled = 0;
    for (JobId jobId : jobIds)
    {
        auto it = m_tokens.find(jobId);
        if (it != m_tokens.end())
        {
            it->second.cancel();
            ++cancelled;
        }
    }
    return cancelled;
}

size_t CancellationRegistry::cancelAll()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& entry : m_tokens)
    {
        entry.second.cancel();
    }
    return m_tokens.size();
}

bool CancellationRegistry::unregister(JobId jobId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tokens.erase(jobId) > 0;
}

std::optional<CancellationToken> CancellationRegistry::get(JobId jobId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tokens.find(jobId);
    if (it == m_tokens.end())
    {
        return std::nullopt;
    }
    return it->second;
}

size_t CancellationRegistry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tokens.size();
}

bool CancellationRegistry::empty() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tokens.empty();
}

void CancellationRegistry::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tokens.clear();
}
