#ifndef LRU_INDEX_H
#define LRU_INDEX_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

using CacheKey = uint64_t;

/**
 * @brief Counters and occupancy of one cache tier
 */
struct CacheStats
{
    size_t entryCount = 0;
    size_t bytesUsed = 0;
    size_t bytesLimit = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;

    double hitRate() const
    {
        uint64_t total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }

    double utilization() const
    {
        return bytesLimit == 0 ? 0.0 : static_cast<double>(bytesUsed) / static_cast<double>(bytesLimit);
    }
};

/**
 * @brief Byte-budgeted LRU bookkeeping shared by the cache tiers
 *
 * Recency comes from a logical counter that advances once per touch (insert
 * or hit); wall-clock time is never consulted. Pinned entries are skipped by
 * eviction. Eviction stops when one entry is left, so a single entry larger
 * than the limit is kept on its own.
 *
 * Not thread-safe: each tier guards its index with its own mutex and hands
 * evicted values back to the caller so they can be released outside it.
 */
template <typename Value, typename Key = CacheKey, typename Hash = std::hash<Key>>
class LruIndex
{
public:
    struct Entry
    {
        Value value;
        size_t byteSize = 0;
        uint64_t lastAccess = 0;
        uint32_t pinCount = 0;
    };

    using Evicted = std::vector<std::pair<Key, Value>>;

    explicit LruIndex(size_t limitBytes)
        : m_limit(limitBytes)
    {
    }

    bool contains(Key key) const
    {
        return m_entries.find(key) != m_entries.end();
    }

    // Hit bumps recency; both outcomes are counted
    Value* get(Key key)
    {
        auto it = m_entries.find(key);
        if (it == m_entries.end())
        {
            ++m_misses;
            return nullptr;
        }
        ++m_hits;
        touch(key, it->second);
        return &it->second.value;
    }

    // No statistics, no recency change
    const Value* peek(Key key) const
    {
        auto it = m_entries.find(key);
        return it == m_entries.end() ? nullptr : &it->second.value;
    }

    struct InsertResult
    {
        std::optional<Value> replaced;
        Evicted evicted;
    };

    /**
     * Insert or replace an entry, then evict down to the limit. A replaced
     * entry keeps its pin count.
     */
    InsertResult insert(Key key, Value value, size_t byteSize)
    {
        InsertResult result;
        uint32_t pins = 0;
        auto it = m_entries.find(key);
        if (it != m_entries.end())
        {
            m_order.erase(it->second.lastAccess);
            m_bytes -= it->second.byteSize;
            pins = it->second.pinCount;
            result.replaced = std::move(it->second.value);
            m_entries.erase(it);
        }

        Entry& entry = emplaceEntry(key, std::move(value), byteSize);
        entry.pinCount = pins;

        result.evicted = evictToBudget();
        return result;
    }

    std::optional<Value> remove(Key key)
    {
        auto it = m_entries.find(key);
        if (it == m_entries.end())
        {
            return std::nullopt;
        }
        m_order.erase(it->second.lastAccess);
        m_bytes -= it->second.byteSize;
        Value value = std::move(it->second.value);
        m_entries.erase(it);
        return value;
    }

    Evicted clear()
    {
        Evicted released;
        released.reserve(m_entries.size());
        for (auto& entry : m_entries)
        {
            released.emplace_back(entry.first, std::move(entry.second.value));
        }
        m_entries.clear();
        m_order.clear();
        m_bytes = 0;
        return released;
    }

    Evicted setLimit(size_t limitBytes)
    {
        m_limit = limitBytes;
        return evictToBudget();
    }

    Evicted evictToBudget()
    {
        return evictToBudget([](const Key&) { return false; });
    }

    /**
     * Same as evictToBudget(), but entries for which isProtected(key) holds
     * are never chosen
     */
    template <typename Predicate>
    Evicted evictToBudget(Predicate isProtected)
    {
        Evicted evicted;
        while (m_bytes > m_limit && m_entries.size() > 1)
        {
            if (!evictOldest(evicted, isProtected))
            {
                break;
            }
        }
        return evicted;
    }

    // Evicts LRU entries until at least bytes have been freed (or nothing is evictable)
    Evicted evictBytes(size_t bytes)
    {
        Evicted evicted;
        size_t freed = 0;
        while (freed < bytes && !m_entries.empty())
        {
            size_t before = m_bytes;
            if (!evictOldest(evicted, [](const Key&) { return false; }))
            {
                break;
            }
            freed += before - m_bytes;
        }
        return evicted;
    }

    // Adjust the accounted size of an entry without touching recency
    bool resize(Key key, size_t byteSize)
    {
        auto it = m_entries.find(key);
        if (it == m_entries.end())
        {
            return false;
        }
        m_bytes = m_bytes - it->second.byteSize + byteSize;
        it->second.byteSize = byteSize;
        return true;
    }

    // For tiers whose lookups can fail after the index said yes
    void countMiss()
    {
        ++m_misses;
    }

    bool pin(Key key)
    {
        auto it = m_entries.find(key);
        if (it == m_entries.end())
        {
            return false;
        }
        ++it->second.pinCount;
        return true;
    }

    bool unpin(Key key)
    {
        auto it = m_entries.find(key);
        if (it == m_entries.end() || it->second.pinCount == 0)
        {
            return false;
        }
        --it->second.pinCount;
        return true;
    }

    uint32_t pinCount(Key key) const
    {
        auto it = m_entries.find(key);
        return it == m_entries.end() ? 0 : it->second.pinCount;
    }

    std::vector<Key> keys() const
    {
        std::vector<Key> result;
        result.reserve(m_entries.size());
        for (const auto& entry : m_order)
        {
            result.push_back(entry.second);
        }
        return result;
    }

    CacheStats stats() const
    {
        CacheStats snapshot;
        snapshot.entryCount = m_entries.size();
        snapshot.bytesUsed = m_bytes;
        snapshot.bytesLimit = m_limit;
        snapshot.hits = m_hits;
        snapshot.misses = m_misses;
        snapshot.evictions = m_evictions;
        return snapshot;
    }

    size_t size() const
    {
        return m_entries.size();
    }

    size_t bytesUsed() const
    {
        return m_bytes;
    }

    size_t limit() const
    {
        return m_limit;
    }

private:
    Entry& emplaceEntry(Key key, Value value, size_t byteSize)
    {
        Entry entry;
        entry.value = std::move(value);
        entry.byteSize = byteSize;
        entry.lastAccess = ++m_clock;
        m_order.emplace(entry.lastAccess, key);
        m_bytes += byteSize;
        return m_entries.emplace(key, std::move(entry)).first->second;
    }

    void touch(Key key, Entry& entry)
    {
        m_order.erase(entry.lastAccess);
        entry.lastAccess = ++m_clock;
        m_order.emplace(entry.lastAccess, key);
    }

    template <typename Predicate>
    bool evictOldest(Evicted& evicted, const Predicate& isProtected)
    {
        for (auto orderIt = m_order.begin(); orderIt != m_order.end(); ++orderIt)
        {
            auto it = m_entries.find(orderIt->second);
            if (it->second.pinCount > 0 || isProtected(it->first))
            {
                continue;
            }
            m_bytes -= it->second.byteSize;
            evicted.emplace_back(it->first, std::move(it->second.value));
            m_entries.erase(it);
            m_order.erase(orderIt);
            ++m_evictions;
            return true;
        }
        return false;
    }

    std::unordered_map<Key, Entry, Hash> m_entries;
    std::map<uint64_t, Key> m_order; // lastAccess -> key, oldest first
    size_t m_bytes = 0;
    size_t m_limit;
    uint64_t m_clock = 0;
    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
};

#endif // LRU_INDEX_H
