#include "tiered_tile_cache.h"

#include <iostream>
#include <utility>

TieredTileCache::TieredTileCache(const TileCacheConfig& config, uint64_t documentFingerprint)
    : m_documentFingerprint(documentFingerprint), m_disk(config.diskCacheDir, config.diskCacheBytes), m_io(m_disk),
      m_ram(config.ramCacheBytes), m_gpu(config.gpuCacheBytes), m_monitor(config.memoryBudget(), m_ram, m_gpu, &m_disk)
{
    size_t restored = m_disk.loadFromDisk();
    if (restored > 0)
    {
        std::cout << "TieredTileCache: Restored " << restored << " tiles from " << m_disk.getCacheDir() << std::endl;
    }

    m_io.start();
    m_ram.setEvictionListener([this](const CachedTilePtr& tile) { spill(tile); });
}

TieredTileCache::~TieredTileCache()
{
    m_ram.setEvictionListener(nullptr);
    m_io.stop();
}

void TieredTileCache::store(const RenderedTile& tile)
{
    m_ram.insert(tile);
}

CachedTilePtr TieredTileCache::lookup(CacheKey key)
{
    return m_ram.get(key);
}

void TieredTileCache::fetch(CacheKey key, FetchCallback onDone)
{
    CachedTilePtr tile = m_ram.get(key);
    if (tile || !m_disk.contains(diskKey(key)))
    {
        if (onDone)
        {
            onDone(tile);
        }
        return;
    }

    m_io.read(diskKey(key),
              [this, key, onDone = std::move(onDone)](std::optional<DiskCachedTile> diskTile)
              {
                  CachedTilePtr promoted;
                  if (diskTile)
                  {
                      m_ram.insert(key, std::move(diskTile->pixels), diskTile->width, diskTile->height);
                      promoted = m_ram.get(key);
                  }
                  if (onDone)
                  {
                      onDone(promoted);
                  }
              });
}

bool TieredTileCache::contains(CacheKey key) const
{
    return m_ram.contains(key) || m_gpu.contains(key) || m_disk.contains(diskKey(key));
}

SDL_Texture* TieredTileCache::uploadToGpu(SDL_Renderer* renderer, CacheKey key)
{
    if (SDL_Texture* texture = m_gpu.get(key))
    {
        return texture;
    }

    CachedTilePtr tile = m_ram.get(key);
    if (!tile)
    {
        return nullptr;
    }
    return m_gpu.upload(renderer, key, *tile);
}

EvictionRecommendation TieredTileCache::enforceBudget(bool includeGpu)
{
    return m_monitor.enforceBudget(includeGpu);
}

void TieredTileCache::flush()
{
    m_io.flush();
}

void TieredTileCache::clear()
{
    m_io.flush();
    m_gpu.clear();
    m_ram.clear();
    m_disk.clear();
}

AggregatedCacheStats TieredTileCache::stats() const
{
    return m_monitor.aggregateStats();
}

void TieredTileCache::spill(const CachedTilePtr& tile)
{
    if (!tile || m_disk.contains(diskKey(tile->key)))
    {
        return;
    }

    ++m_spilledTiles;
    CacheKey key = tile->key;
    m_io.write(diskKey(key), tile->pixels, tile->width, tile->height,
               [key](bool stored)
               {
                   if (!stored)
                   {
                       std::cerr << "TieredTileCache: Failed to spill tile " << key << " to disk" << std::endl;
                   }
               });
}
