#ifndef GPU_TEXTURE_CACHE_H
#define GPU_TEXTURE_CACHE_H

#include "lru_index.h"

#include <SDL.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

struct CachedTile;
struct RenderedTile;

struct SDLTextureDeleter
{
    void operator()(SDL_Texture* texture) const
    {
        if (texture)
        {
            SDL_DestroyTexture(texture);
        }
    }
};

using TexturePtr = std::unique_ptr<SDL_Texture, SDLTextureDeleter>;

/**
 * @brief GPU tier: SDL textures with a byte budget and LRU eviction
 *
 * Textures are destroyed synchronously when evicted, under the cache lock and
 * before the evicting call returns, so GPU memory never lags the accounting.
 * Returned SDL_Texture pointers are non-owning and stay valid until the entry
 * is evicted or removed; pin an entry to keep it across an eviction point.
 *
 * SDL requires textures to be created and destroyed on the thread that owns
 * the renderer, so all calls belong on the UI thread.
 */
class GpuTextureCache
{
public:
    using EvictionListener = std::function<void(CacheKey)>;

    explicit GpuTextureCache(size_t limitBytes);
    ~GpuTextureCache();

    GpuTextureCache(const GpuTextureCache&) = delete;
    GpuTextureCache& operator=(const GpuTextureCache&) = delete;

    /**
     * Take ownership of a texture and account width * height * 4 bytes
     */
    void insert(CacheKey key, TexturePtr texture, uint32_t width, uint32_t height);

    /**
     * Create a static RGBA32 texture from tile pixels and cache it
     * @return The cached texture, or nullptr if SDL failed (logged)
     */
    SDL_Texture* upload(SDL_Renderer* renderer, CacheKey key, const CachedTile& tile);
    SDL_Texture* upload(SDL_Renderer* renderer, const RenderedTile& tile);

    SDL_Texture* get(CacheKey key);
    bool contains(CacheKey key) const;

    bool remove(CacheKey key);
    void clear();

    void setLimit(size_t limitBytes);
    size_t evictBytes(size_t bytes);

    // Pinned entries are never evicted; pins nest
    bool pin(CacheKey key);
    bool unpin(CacheKey key);
    uint32_t pinCount(CacheKey key) const;

    // Called after the lock is released; the texture is already destroyed
    void setEvictionListener(EvictionListener listener);

    CacheStats stats() const;
    size_t bytesUsed() const;
    size_t limit() const;

    static size_t textureBytes(uint32_t width, uint32_t height)
    {
        return static_cast<size_t>(width) * height * 4;
    }

private:
    SDL_Texture* createTexture(SDL_Renderer* renderer, CacheKey key, const uint8_t* pixels, uint32_t width,
                               uint32_t height);
    void notifyEvicted(const std::vector<CacheKey>& keys);

    LruIndex<TexturePtr> m_index;
    mutable std::mutex m_mutex;
    EvictionListener m_listener;
};

#endif // GPU_TEXTURE_CACHE_H
