#ifndef TIERED_TILE_CACHE_H
#define TIERED_TILE_CACHE_H

#include "disk_io_thread.h"
#include "disk_tile_cache.h"
#include "gpu_texture_cache.h"
#include "memory_budget.h"
#include "ram_tile_cache.h"
#include "tile_cache_config.h"
#include "tile_id.h"

#include <SDL.h>
#include <atomic>
#include <cstdint>
#include <functional>

/**
 * @brief RAM, GPU and disk tiers wired together
 *
 * Tiles evicted from RAM are spilled to disk on the I/O thread; tiles fetched
 * from disk are promoted back into RAM. The CacheMonitor keeps RAM + GPU
 * under the combined budget.
 *
 * RAM and GPU belong to one document and use plain tile keys. The disk
 * directory is shared between documents, so every disk access goes through
 * diskKey(), which scopes the key to this cache's document fingerprint.
 */
class TieredTileCache
{
public:
    using FetchCallback = std::function<void(CachedTilePtr)>;

    TieredTileCache(const TileCacheConfig& config, uint64_t documentFingerprint);
    ~TieredTileCache();

    TieredTileCache(const TieredTileCache&) = delete;
    TieredTileCache& operator=(const TieredTileCache&) = delete;

    /**
     * @brief Store a freshly rendered tile in RAM
     */
    void store(const RenderedTile& tile);

    /**
     * @brief RAM lookup only, never touches the disk
     */
    CachedTilePtr lookup(CacheKey key);

    /**
     * @brief Deliver a tile from RAM, or from disk via the I/O thread
     *
     * A RAM hit invokes the callback immediately on the calling thread. A
     * disk hit is promoted into RAM before the callback runs on the I/O
     * thread. A miss in both tiers delivers nullptr.
     */
    void fetch(CacheKey key, FetchCallback onDone);

    // Any tier, without touching recency
    bool contains(CacheKey key) const;

    /**
     * @brief Make a RAM tile resident on the GPU (UI thread only)
     * @return Existing or newly created texture, nullptr if the tile is not in RAM
     */
    SDL_Texture* uploadToGpu(SDL_Renderer* renderer, CacheKey key);

    /**
     * @brief Evict RAM (and GPU when includeGpu) down to the budget target
     *        if pressure calls for it
     */
    EvictionRecommendation enforceBudget(bool includeGpu);

    // Block until pending spills and reads have finished
    void flush();

    // Drop every tier, including the files of the disk tier
    void clear();

    AggregatedCacheStats stats() const;

    CacheKey diskKey(CacheKey key) const
    {
        return documentScopedKey(key, m_documentFingerprint);
    }
    uint64_t documentFingerprint() const
    {
        return m_documentFingerprint;
    }

    uint64_t spilledTiles() const
    {
        return m_spilledTiles.load();
    }

    RamTileCache& ram()
    {
        return m_ram;
    }
    GpuTextureCache& gpu()
    {
        return m_gpu;
    }
    DiskTileCache& disk()
    {
        return m_disk;
    }
    CacheMonitor& monitor()
    {
        return m_monitor;
    }

private:
    void spill(const CachedTilePtr& tile);

    uint64_t m_documentFingerprint;
    DiskTileCache m_disk;
    DiskIoThread m_io;
    RamTileCache m_ram;
    GpuTextureCache m_gpu;
    CacheMonitor m_monitor;
    std::atomic<uint64_t> m_spilledTiles{0};
};

#endif // TIERED_TILE_CACHE_H
