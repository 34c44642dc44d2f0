#ifndef MEMORY_BUDGET_H
#define MEMORY_BUDGET_H

#include "lru_index.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>

class RamTileCache;
class GpuTextureCache;
class DiskTileCache;

enum class MemoryPressure
{
    Normal,
    Warning,
    Critical
};

const char* memoryPressureName(MemoryPressure pressure);

inline bool needsEviction(MemoryPressure pressure)
{
    return pressure != MemoryPressure::Normal;
}

/**
 * @brief Combined RAM + GPU budget and its pressure thresholds
 *
 * Thresholds are fractions of totalBudget and are clamped to [0, 1].
 */
struct MemoryBudgetConfig
{
    size_t totalBudget = static_cast<size_t>(768) * 1024 * 1024;
    double warningThreshold = 0.85;
    double criticalThreshold = 0.95;
    double targetUtilization = 0.80; // Eviction aims for this fraction

    static MemoryBudgetConfig withMegabytes(size_t totalMb);

    MemoryBudgetConfig& withWarningThreshold(double threshold);
    MemoryBudgetConfig& withCriticalThreshold(double threshold);
    MemoryBudgetConfig& withTargetUtilization(double target);

    size_t warningBytes() const;
    size_t criticalBytes() const;
    size_t targetBytes() const;
};

MemoryPressure classifyPressure(size_t usedBytes, const MemoryBudgetConfig& config);

struct MemoryCheckResult
{
    bool canProceed = true;
    MemoryPressure pressure = MemoryPressure::Normal;
    size_t bytesToEvictFirst = 0;
};

/**
 * @brief Read-only view of the combined budget over a live usage source
 *
 * The usage source returns the bytes currently resident in RAM and GPU; the
 * budget itself keeps no usage counter, so it can never drift from the tiers.
 */
class MemoryBudget
{
public:
    using UsageSource = std::function<size_t()>;

    MemoryBudget(const MemoryBudgetConfig& config, UsageSource usageSource);

    size_t currentUsage() const;
    size_t totalBudget() const
    {
        return m_config.totalBudget;
    }
    size_t available() const;
    double utilization() const;
    MemoryPressure pressure() const;

    bool canAllocate(size_t bytes) const;
    bool wouldTriggerPressure(size_t bytes) const;

    // Bytes above the target utilization
    size_t bytesToEvict() const;
    bool needsEviction() const;

    MemoryCheckResult checkAllocation(size_t bytes) const;

    const MemoryBudgetConfig& getConfig() const
    {
        return m_config;
    }
    void setTotalBudget(size_t bytes)
    {
        m_config.totalBudget = bytes;
    }

private:
    MemoryBudgetConfig m_config;
    UsageSource m_usageSource;
};

struct AggregatedCacheStats
{
    CacheStats ram;
    CacheStats gpu;
    CacheStats disk;

    size_t totalMemoryUsed() const
    {
        return ram.bytesUsed + gpu.bytesUsed;
    }
    size_t totalMemoryLimit() const
    {
        return ram.bytesLimit + gpu.bytesLimit;
    }
    double memoryUtilization() const;
    // RAM + GPU lookups; disk reads are an I/O path, not a cache hit
    double overallHitRate() const;
    uint64_t totalEvictions() const
    {
        return ram.evictions + gpu.evictions + disk.evictions;
    }
    size_t totalCachedItems() const
    {
        return ram.entryCount + gpu.entryCount + disk.entryCount;
    }
};

struct EvictionRecommendation
{
    size_t ramBytes = 0;
    size_t gpuBytes = 0;
};

/**
 * @brief Watches the memory tiers against the combined budget
 */
class CacheMonitor
{
public:
    CacheMonitor(const MemoryBudgetConfig& config, RamTileCache& ram, GpuTextureCache& gpu,
                 DiskTileCache* disk = nullptr);

    const MemoryBudget& getBudget() const
    {
        return m_budget;
    }

    AggregatedCacheStats aggregateStats() const;

    MemoryPressure pressure() const
    {
        return m_budget.pressure();
    }
    bool needsEviction() const
    {
        return m_budget.needsEviction();
    }

    /**
     * Split bytesToEvict() between RAM and GPU in proportion to their usage
     * (evenly when both are empty)
     */
    EvictionRecommendation recommendEviction(const AggregatedCacheStats& stats) const;

    /**
     * Evict the recommended bytes when pressure calls for it
     * @param includeGpu GPU textures may only be released on the UI thread;
     *        worker threads pass false and only trim RAM
     * @return Bytes actually freed per tier
     */
    EvictionRecommendation enforceBudget(bool includeGpu = true);

private:
    void notePressure(MemoryPressure pressure);

    RamTileCache& m_ram;
    GpuTextureCache& m_gpu;
    DiskTileCache* m_disk;
    MemoryBudget m_budget;
    std::atomic<int> m_lastPressure{static_cast<int>(MemoryPressure::Normal)};
};

#endif // MEMORY_BUDGET_H
