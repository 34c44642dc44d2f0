#include "memory_budget.h"
#include "disk_tile_cache.h"
#include "gpu_texture_cache.h"
#include "ram_tile_cache.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace
{
double clampUnit(double value)
{
    return std::min(1.0, std::max(0.0, value));
}

size_t fractionOf(size_t total, double fraction)
{
    return static_cast<size_t>(static_cast<double>(total) * fraction);
}
} // namespace

const char* memoryPressureName(MemoryPressure pressure)
{
    switch (pressure)
    {
    case MemoryPressure::Normal:
        return "Normal";
    case MemoryPressure::Warning:
        return "Warning";
    case MemoryPressure::Critical:
        return "Critical";
    }
    return "Unknown";
}

MemoryBudgetConfig MemoryBudgetConfig::withMegabytes(size_t totalMb)
{
    MemoryBudgetConfig config;
    config.totalBudget = totalMb * 1024 * 1024;
    return config;
}

MemoryBudgetConfig& MemoryBudgetConfig::withWarningThreshold(double threshold)
{
    warningThreshold = clampUnit(threshold);
    return *this;
}

MemoryBudgetConfig& MemoryBudgetConfig::withCriticalThreshold(double threshold)
{
    criticalThreshold = clampUnit(threshold);
    return *this;
}

MemoryBudgetConfig& MemoryBudgetConfig::withTargetUtilization(double target)
{
    targetUtilization = clampUnit(target);
    return *this;
}

size_t MemoryBudgetConfig::warningBytes() const
{
    return fractionOf(totalBudget, warningThreshold);
}

size_t MemoryBudgetConfig::criticalBytes() const
{
    return fractionOf(totalBudget, criticalThreshold);
}

size_t MemoryBudgetConfig::targetBytes() const
{
    return fractionOf(totalBudget, targetUtilization);
}

MemoryPressure classifyPressure(size_t usedBytes, const MemoryBudgetConfig& config)
{
    if (usedBytes >= config.criticalBytes())
    {
        return MemoryPressure::Critical;
    }
    if (usedBytes >= config.warningBytes())
    {
        return MemoryPressure::Warning;
    }
    return MemoryPressure::Normal;
}

MemoryBudget::MemoryBudget(const MemoryBudgetConfig& config, UsageSource usageSource)
    : m_config(config), m_usageSource(std::move(usageSource))
{
    if (!m_usageSource)
    {
        throw std::invalid_argument("MemoryBudget requires a usage source");
    }
}

size_t MemoryBudget::currentUsage() const
{
    return m_usageSource();
}

size_t MemoryBudget::available() const
{
    size_t used = currentUsage();
    return used >= m_config.totalBudget ? 0 : m_config.totalBudget - used;
}

double MemoryBudget::utilization() const
{
    if (m_config.totalBudget == 0)
    {
        return 0.0;
    }
    return static_cast<double>(currentUsage()) / static_cast<double>(m_config.totalBudget);
}

MemoryPressure MemoryBudget::pressure() const
{
    return classifyPressure(currentUsage(), m_config);
}

bool MemoryBudget::canAllocate(size_t bytes) const
{
    return currentUsage() + bytes <= m_config.totalBudget;
}

bool MemoryBudget::wouldTriggerPressure(size_t bytes) const
{
    return currentUsage() + bytes > m_config.warningBytes();
}

size_t MemoryBudget::bytesToEvict() const
{
    size_t used = currentUsage();
    size_t target = m_config.targetBytes();
    return used > target ? used - target : 0;
}

bool MemoryBudget::needsEviction() const
{
    return ::needsEviction(pressure());
}

MemoryCheckResult MemoryBudget::checkAllocation(size_t bytes) const
{
    size_t afterAllocation = currentUsage() + bytes;

    MemoryCheckResult result;
    if (afterAllocation <= m_config.totalBudget)
    {
        result.canProceed = true;
        result.pressure = classifyPressure(afterAllocation, m_config);
        result.bytesToEvictFirst = 0;
    }
    else
    {
        size_t target = m_config.targetBytes();
        result.canProceed = false;
        result.pressure = MemoryPressure::Critical;
        result.bytesToEvictFirst = afterAllocation > target ? afterAllocation - target : 0;
    }
    return result;
}

double AggregatedCacheStats::memoryUtilization() const
{
    size_t limit = totalMemoryLimit();
    return limit == 0 ? 0.0 : static_cast<double>(totalMemoryUsed()) / static_cast<double>(limit);
}

double AggregatedCacheStats::overallHitRate() const
{
    uint64_t hits = ram.hits + gpu.hits;
    uint64_t total = hits + ram.misses + gpu.misses;
    return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
}

CacheMonitor::CacheMonitor(const MemoryBudgetConfig& config, RamTileCache& ram, GpuTextureCache& gpu,
                           DiskTileCache* disk)
    : m_ram(ram), m_gpu(gpu), m_disk(disk),
      m_budget(config, [&ram, &gpu]() { return ram.bytesUsed() + gpu.bytesUsed(); })
{
}

AggregatedCacheStats CacheMonitor::aggregateStats() const
{
    AggregatedCacheStats stats;
    stats.ram = m_ram.stats();
    stats.gpu = m_gpu.stats();
    if (m_disk)
    {
        stats.disk = m_disk->stats();
    }
    return stats;
}

EvictionRecommendation CacheMonitor::recommendEviction(const AggregatedCacheStats& stats) const
{
    EvictionRecommendation recommendation;
    size_t total = m_budget.bytesToEvict();
    if (total == 0)
    {
        return recommendation;
    }

    size_t used = stats.totalMemoryUsed();
    double ramRatio = used == 0 ? 0.5 : static_cast<double>(stats.ram.bytesUsed) / static_cast<double>(used);

    recommendation.ramBytes = static_cast<size_t>(static_cast<double>(total) * ramRatio);
    recommendation.gpuBytes = total - recommendation.ramBytes;
    return recommendation;
}

EvictionRecommendation CacheMonitor::enforceBudget(bool includeGpu)
{
    EvictionRecommendation freed;
    MemoryPressure before = m_budget.pressure();
    notePressure(before);
    if (!::needsEviction(before))
    {
        return freed;
    }

    EvictionRecommendation recommendation = recommendEviction(aggregateStats());
    if (recommendation.ramBytes > 0)
    {
        freed.ramBytes = m_ram.evictBytes(recommendation.ramBytes);
    }
    if (includeGpu && recommendation.gpuBytes > 0)
    {
        freed.gpuBytes = m_gpu.evictBytes(recommendation.gpuBytes);
    }

    notePressure(m_budget.pressure());
    return freed;
}

void CacheMonitor::notePressure(MemoryPressure pressure)
{
    int previous = m_lastPressure.exchange(static_cast<int>(pressure));
    if (previous != static_cast<int>(pressure))
    {
        std::cout << "CacheMonitor: Memory pressure " << memoryPressureName(static_cast<MemoryPressure>(previous))
                  << " -> " << memoryPressureName(pressure) << " (" << m_budget.currentUsage() / (1024 * 1024)
                  << " MB of " << m_budget.totalBudget() / (1024 * 1024) << " MB)" << std::endl;
    }
}
