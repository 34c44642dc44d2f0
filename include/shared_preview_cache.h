#ifndef SHARED_PREVIEW_CACHE_H
#define SHARED_PREVIEW_CACHE_H

#include "lru_index.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>

/**
 * @brief Low-resolution RGBA8 image of a whole page
 */
struct PreviewImage
{
    std::vector<uint8_t> pixels;
    uint32_t width = 0;
    uint32_t height = 0;

    size_t byteSize() const
    {
        return pixels.size();
    }
};

using PreviewImagePtr = std::shared_ptr<const PreviewImage>;

struct PreviewKey
{
    uint64_t docFingerprint = 0;
    uint16_t pageIndex = 0;

    bool operator==(const PreviewKey& other) const
    {
        return docFingerprint == other.docFingerprint && pageIndex == other.pageIndex;
    }
};

struct PreviewKeyHash
{
    size_t operator()(const PreviewKey& key) const
    {
        return std::hash<uint64_t>()(key.docFingerprint ^ (static_cast<uint64_t>(key.pageIndex) << 48));
    }
};

struct PreviewCacheSnapshot
{
    size_t currentBytes = 0;
    size_t peakBytes = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
};

/**
 * @brief Page previews shown while tiles are still rendering
 *
 * Shared by every open document; entries are keyed by document fingerprint
 * and page. Page navigation calls trimToBudget() with the pages around the
 * current one so they survive eviction.
 */
class SharedPreviewCache
{
public:
    /**
     * @brief Preview share of a memory budget: 10%, clamped to [32 MB, 192 MB]
     */
    static size_t previewBudgetBytes(size_t totalBudgetBytes);

    // A zero limit is raised to one byte
    explicit SharedPreviewCache(size_t maxBytes);

    bool contains(uint64_t docFingerprint, uint16_t pageIndex) const;

    PreviewImagePtr get(uint64_t docFingerprint, uint16_t pageIndex);

    void insert(uint64_t docFingerprint, uint16_t pageIndex, PreviewImage image);

    /**
     * @brief Evict LRU previews until within budget, never touching the pages
     *        in keepPages of the given document
     */
    void trimToBudget(const std::unordered_set<uint16_t>& keepPages, uint64_t docFingerprint);

    // @return Number of previews dropped
    size_t removeDocument(uint64_t docFingerprint);

    PreviewCacheSnapshot snapshot() const;

    size_t size() const;
    size_t limit() const;

private:
    LruIndex<PreviewImagePtr, PreviewKey, PreviewKeyHash> m_index;
    size_t m_peakBytes = 0;
    mutable std::mutex m_mutex;
};

#endif // SHARED_PREVIEW_CACHE_H
