#include "shared_preview_cache.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace
{
constexpr size_t MB = 1024 * 1024;
constexpr size_t PREVIEW_BUDGET_MIN_BYTES = 32 * MB;
constexpr size_t PREVIEW_BUDGET_MAX_BYTES = 192 * MB;
constexpr double PREVIEW_BUDGET_RATIO = 0.10;
} // namespace

size_t SharedPreviewCache::previewBudgetBytes(size_t totalBudgetBytes)
{
    size_t proportional = static_cast<size_t>(std::llround(static_cast<double>(totalBudgetBytes) * PREVIEW_BUDGET_RATIO));
    return std::clamp(proportional, PREVIEW_BUDGET_MIN_BYTES, PREVIEW_BUDGET_MAX_BYTES);
}

SharedPreviewCache::SharedPreviewCache(size_t maxBytes)
    : m_index(std::max<size_t>(maxBytes, 1))
{
}

bool SharedPreviewCache::contains(uint64_t docFingerprint, uint16_t pageIndex) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.contains(PreviewKey{docFingerprint, pageIndex});
}

PreviewImagePtr SharedPreviewCache::get(uint64_t docFingerprint, uint16_t pageIndex)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    PreviewImagePtr* image = m_index.get(PreviewKey{docFingerprint, pageIndex});
    return image ? *image : nullptr;
}

void SharedPreviewCache::insert(uint64_t docFingerprint, uint16_t pageIndex, PreviewImage image)
{
    size_t size = image.byteSize();
    auto shared = std::make_shared<const PreviewImage>(std::move(image));

    std::lock_guard<std::mutex> lock(m_mutex);
    PreviewKey key{docFingerprint, pageIndex};

    // Peak is sampled between adding the new bytes and evicting
    size_t replacedBytes = 0;
    if (const PreviewImagePtr* existing = m_index.peek(key))
    {
        replacedBytes = (*existing)->byteSize();
    }
    m_peakBytes = std::max(m_peakBytes, m_index.bytesUsed() - replacedBytes + size);

    m_index.insert(key, std::move(shared), size);
}

void SharedPreviewCache::trimToBudget(const std::unordered_set<uint16_t>& keepPages, uint64_t docFingerprint)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_index.evictToBudget([&keepPages, docFingerprint](const PreviewKey& key)
                          { return key.docFingerprint == docFingerprint && keepPages.count(key.pageIndex) > 0; });
}

size_t SharedPreviewCache::removeDocument(uint64_t docFingerprint)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t removed = 0;
    for (const PreviewKey& key : m_index.keys())
    {
        if (key.docFingerprint == docFingerprint && m_index.remove(key))
        {
            ++removed;
        }
    }
    return removed;
}

PreviewCacheSnapshot SharedPreviewCache::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    CacheStats stats = m_index.stats();

    PreviewCacheSnapshot snapshot;
    snapshot.currentBytes = stats.bytesUsed;
    snapshot.peakBytes = m_peakBytes;
    snapshot.hits = stats.hits;
    snapshot.misses = stats.misses;
    return snapshot;
}

size_t SharedPreviewCache::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.size();
}

size_t SharedPreviewCache::limit() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.limit();
}
