#ifndef RAM_TILE_CACHE_H
#define RAM_TILE_CACHE_H

#include "lru_index.h"
#include "tile_id.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @brief Decoded RGBA8 pixels of one tile held in RAM
 */
struct CachedTile
{
    CacheKey key = 0;
    std::vector<uint8_t> pixels;
    uint32_t width = 0;
    uint32_t height = 0;

    size_t memorySize() const
    {
        return pixels.size();
    }
};

using CachedTilePtr = std::shared_ptr<const CachedTile>;

/**
 * @brief RAM tier of the tile cache with byte-budget LRU eviction
 *
 * Tiles are handed out as shared pointers so a reader keeps the pixels alive
 * even if the entry is evicted while it is being drawn or spilled. Eviction
 * listeners run after the cache lock is released.
 */
class RamTileCache
{
public:
    using EvictionListener = std::function<void(const CachedTilePtr&)>;

    explicit RamTileCache(size_t limitBytes);

    static size_t megabytes(size_t mb)
    {
        return mb * 1024 * 1024;
    }

    /**
     * Store a tile, replacing any existing entry for the key
     */
    void insert(CacheKey key, std::vector<uint8_t> pixels, uint32_t width, uint32_t height);
    void insert(const RenderedTile& tile);

    CachedTilePtr get(CacheKey key);

    // Does not touch recency or statistics
    bool contains(CacheKey key) const;

    bool remove(CacheKey key);
    void clear();

    void setLimit(size_t limitBytes);

    /**
     * Evict least-recently-used tiles until at least the given number of
     * bytes has been freed
     * @return Bytes actually freed
     */
    size_t evictBytes(size_t bytes);

    // Called once per evicted tile (not for explicit remove/clear)
    void setEvictionListener(EvictionListener listener);

    CacheStats stats() const;
    size_t bytesUsed() const;
    size_t limit() const;

private:
    void notifyEvicted(LruIndex<CachedTilePtr>::Evicted& evicted);

    LruIndex<CachedTilePtr> m_index;
    mutable std::mutex m_mutex;

    EvictionListener m_listener;
    std::mutex m_listenerMutex;
};

#endif // RAM_TILE_CACHE_H
