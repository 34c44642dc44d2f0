#ifndef DISK_TILE_CACHE_H
#define DISK_TILE_CACHE_H

#include "lru_index.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

/**
 * @brief Tile pixels read back from the disk tier
 */
struct DiskCachedTile
{
    CacheKey key = 0;
    std::vector<uint8_t> pixels;
    uint32_t width = 0;
    uint32_t height = 0;
};

/**
 * @brief Persistent tier: one file per tile under a cache directory
 *
 * Files are named <cacheKey as 16 hex digits>.tile and hold a small header
 * (magic "PTIL", format version, width, height, little-endian) followed by the
 * RGBA8 pixels. The index mutex is never held during file I/O: the index is
 * consulted or updated before and after each read, write or delete.
 *
 * I/O failures are not fatal. A failed read drops the entry and counts as a
 * miss; a failed write leaves no entry and returns false.
 */
class DiskTileCache
{
public:
    static constexpr uint32_t FORMAT_VERSION = 1;
    static constexpr size_t HEADER_SIZE = 16;

    DiskTileCache(const std::filesystem::path& cacheDir, size_t limitBytes);

    /**
     * Write a tile to disk and index it
     * @return false if the file could not be written
     */
    bool put(CacheKey key, const std::vector<uint8_t>& pixels, uint32_t width, uint32_t height);

    std::optional<DiskCachedTile> get(CacheKey key);

    bool contains(CacheKey key) const;
    bool remove(CacheKey key);
    void clear();

    void setLimit(size_t limitBytes);
    size_t evictBytes(size_t bytes);

    /**
     * Rebuild the index from the files already in the cache directory,
     * oldest modification time first
     * @return Number of tiles found
     */
    size_t loadFromDisk();

    // Re-stat every indexed file; entries whose file vanished are dropped
    void recalculateDiskUsage();

    CacheStats stats() const;
    size_t bytesUsed() const;
    size_t limit() const;
    uint64_t ioErrors() const
    {
        return m_ioErrors.load();
    }

    const std::filesystem::path& getCacheDir() const
    {
        return m_cacheDir;
    }

    std::filesystem::path pathForKey(CacheKey key) const;

    static std::optional<CacheKey> keyFromFileName(const std::filesystem::path& path);

private:
    void deleteFiles(const LruIndex<std::filesystem::path>::Evicted& evicted);

    std::filesystem::path m_cacheDir;
    LruIndex<std::filesystem::path> m_index;
    mutable std::mutex m_mutex;
    std::atomic<uint64_t> m_ioErrors{0};
    std::atomic<uint64_t> m_tempCounter{0};
};

#endif // DISK_TILE_CACHE_H
