#include "gpu_texture_cache.h"
#include "ram_tile_cache.h"
#include "tile_id.h"

#include <iostream>
#include <utility>
#include <vector>

namespace
{
// Destroys the textures (while the caller still holds the lock) and keeps the keys
std::vector<CacheKey> releaseTextures(LruIndex<TexturePtr>::Evicted& evicted)
{
    std::vector<CacheKey> keys;
    keys.reserve(evicted.size());
    for (auto& entry : evicted)
    {
        entry.second.reset();
        keys.push_back(entry.first);
    }
    evicted.clear();
    return keys;
}
} // namespace

GpuTextureCache::GpuTextureCache(size_t limitBytes)
    : m_index(limitBytes)
{
}

GpuTextureCache::~GpuTextureCache()
{
    clear();
}

void GpuTextureCache::insert(CacheKey key, TexturePtr texture, uint32_t width, uint32_t height)
{
    std::vector<CacheKey> evictedKeys;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto result = m_index.insert(key, std::move(texture), textureBytes(width, height));
        result.replaced.reset();
        evictedKeys = releaseTextures(result.evicted);
    }
    notifyEvicted(evictedKeys);
}

SDL_Texture* GpuTextureCache::createTexture(SDL_Renderer* renderer, CacheKey key, const uint8_t* pixels,
                                            uint32_t width, uint32_t height)
{
    if (!renderer || !pixels || width == 0 || height == 0)
    {
        std::cerr << "GpuTextureCache: Refusing to upload empty tile " << key << std::endl;
        return nullptr;
    }

    TexturePtr texture(SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STATIC,
                                         static_cast<int>(width), static_cast<int>(height)));
    if (!texture)
    {
        std::cerr << "GpuTextureCache: Unable to create texture! SDL_Error: " << SDL_GetError() << std::endl;
        return nullptr;
    }

    if (SDL_UpdateTexture(texture.get(), nullptr, pixels, static_cast<int>(width * 4)) != 0)
    {
        std::cerr << "GpuTextureCache: Unable to update texture! SDL_Error: " << SDL_GetError() << std::endl;
        return nullptr;
    }
    SDL_SetTextureBlendMode(texture.get(), SDL_BLENDMODE_BLEND);

    SDL_Texture* raw = texture.get();
    insert(key, std::move(texture), width, height);

    // A texture larger than the whole budget may be dropped again straight away
    return contains(key) ? raw : nullptr;
}

SDL_Texture* GpuTextureCache::upload(SDL_Renderer* renderer, CacheKey key, const CachedTile& tile)
{
    return createTexture(renderer, key, tile.pixels.data(), tile.width, tile.height);
}

SDL_Texture* GpuTextureCache::upload(SDL_Renderer* renderer, const RenderedTile& tile)
{
    return createTexture(renderer, tile.id.cacheKey(), tile.pixels.data(), tile.width, tile.height);
}

SDL_Texture* GpuTextureCache::get(CacheKey key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    TexturePtr* texture = m_index.get(key);
    return texture ? texture->get() : nullptr;
}

bool GpuTextureCache::contains(CacheKey key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.contains(key);
}

bool GpuTextureCache::remove(CacheKey key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.remove(key).has_value();
}

void GpuTextureCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_index.clear();
}

void GpuTextureCache::setLimit(size_t limitBytes)
{
    std::vector<CacheKey> evictedKeys;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto evicted = m_index.setLimit(limitBytes);
        evictedKeys = releaseTextures(evicted);
    }
    notifyEvicted(evictedKeys);
}

size_t GpuTextureCache::evictBytes(size_t bytes)
{
    std::vector<CacheKey> evictedKeys;
    size_t freed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t before = m_index.bytesUsed();
        auto evicted = m_index.evictBytes(bytes);
        freed = before - m_index.bytesUsed();
        evictedKeys = releaseTextures(evicted);
    }
    notifyEvicted(evictedKeys);
    return freed;
}

bool GpuTextureCache::pin(CacheKey key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.pin(key);
}

bool GpuTextureCache::unpin(CacheKey key)
{
    std::vector<CacheKey> evictedKeys;
    bool unpinned = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        unpinned = m_index.unpin(key);
        // Entries kept over budget by the pin can go now
        auto evicted = m_index.evictToBudget();
        evictedKeys = releaseTextures(evicted);
    }
    notifyEvicted(evictedKeys);
    return unpinned;
}

uint32_t GpuTextureCache::pinCount(CacheKey key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.pinCount(key);
}

void GpuTextureCache::setEvictionListener(EvictionListener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

void GpuTextureCache::notifyEvicted(const std::vector<CacheKey>& keys)
{
    if (keys.empty())
    {
        return;
    }

    EvictionListener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        listener = m_listener;
    }
    if (!listener)
    {
        return;
    }
    for (CacheKey key : keys)
    {
        listener(key);
    }
}

CacheStats GpuTextureCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.stats();
}

size_t GpuTextureCache::bytesUsed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.bytesUsed();
}

size_t GpuTextureCache::limit() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.limit();
}
