#include "ram_tile_cache.h"

#include <utility>

RamTileCache::RamTileCache(size_t limitBytes)
    : m_index(limitBytes)
{
}

void RamTileCache::insert(CacheKey key, std::vector<uint8_t> pixels, uint32_t width, uint32_t height)
{
    auto tile = std::make_shared<CachedTile>();
    tile->key = key;
    tile->pixels = std::move(pixels);
    tile->width = width;
    tile->height = height;
    size_t size = tile->memorySize();

    LruIndex<CachedTilePtr>::Evicted evicted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        evicted = m_index.insert(key, std::move(tile), size).evicted;
    }
    notifyEvicted(evicted);
}

void RamTileCache::insert(const RenderedTile& tile)
{
    insert(tile.id.cacheKey(), tile.pixels, tile.width, tile.height);
}

CachedTilePtr RamTileCache::get(CacheKey key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    CachedTilePtr* tile = m_index.get(key);
    return tile ? *tile : nullptr;
}

bool RamTileCache::contains(CacheKey key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.contains(key);
}

bool RamTileCache::remove(CacheKey key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.remove(key).has_value();
}

void RamTileCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_index.clear();
}

void RamTileCache::setLimit(size_t limitBytes)
{
    LruIndex<CachedTilePtr>::Evicted evicted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        evicted = m_index.setLimit(limitBytes);
    }
    notifyEvicted(evicted);
}

size_t RamTileCache::evictBytes(size_t bytes)
{
    LruIndex<CachedTilePtr>::Evicted evicted;
    size_t freed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t before = m_index.bytesUsed();
        evicted = m_index.evictBytes(bytes);
        freed = before - m_index.bytesUsed();
    }
    notifyEvicted(evicted);
    return freed;
}

void RamTileCache::setEvictionListener(EvictionListener listener)
{
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listener = std::move(listener);
}

void RamTileCache::notifyEvicted(LruIndex<CachedTilePtr>::Evicted& evicted)
{
    if (evicted.empty())
    {
        return;
    }

    EvictionListener listener;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        listener = m_listener;
    }
    if (!listener)
    {
        return;
    }

    for (auto& entry : evicted)
    {
        listener(entry.second);
    }
}

CacheStats RamTileCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.stats();
}

size_t RamTileCache::bytesUsed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.bytesUsed();
}

size_t RamTileCache::limit() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.limit();
}
