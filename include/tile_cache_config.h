#ifndef TILE_CACHE_CONFIG_H
#define TILE_CACHE_CONFIG_H

#include "memory_budget.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

/**
 * @brief Thrown for malformed configuration overrides (environment values)
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message)
    {
    }
};

/**
 * @brief User-configurable sizes, locations and thresholds of the tile cache
 *
 * RAM and GPU limits together form the combined memory budget watched by the
 * CacheMonitor. The disk tier has its own independent limit.
 */
struct TileCacheConfig
{
    size_t ramCacheBytes = static_cast<size_t>(256) * 1024 * 1024;
    size_t gpuCacheBytes = static_cast<size_t>(512) * 1024 * 1024;
    size_t diskCacheBytes = static_cast<size_t>(1024) * 1024 * 1024;
    std::filesystem::path diskCacheDir;
    uint32_t tileSize = 256;
    size_t renderWorkers = 0; // 0 = hardware concurrency

    double warningThreshold = 0.85;
    double criticalThreshold = 0.95;
    double targetUtilization = 0.80;

    // diskCacheDir defaults to getDefaultTileCacheDir()
    TileCacheConfig();

    // Size builders throw ConfigError when the byte count overflows
    TileCacheConfig& withRamMb(size_t mb);
    TileCacheConfig& withGpuMb(size_t mb);
    TileCacheConfig& withDiskMb(size_t mb);
    TileCacheConfig& withDiskDir(const std::filesystem::path& dir);

    size_t totalMemoryBytes() const
    {
        return ramCacheBytes + gpuCacheBytes;
    }

    // 10% of the memory budget, clamped to [32 MB, 192 MB]
    size_t previewBudgetBytes() const;

    MemoryBudgetConfig memoryBudget() const;

    /**
     * @brief Base config overridden by PAGETILER_RAM_CACHE_MB, PAGETILER_GPU_CACHE_MB,
     *        PAGETILER_DISK_CACHE_MB and PAGETILER_CACHE_DIR
     * @throws ConfigError if a size variable is not a non-negative integer
     */
    static TileCacheConfig fromEnv(TileCacheConfig base = TileCacheConfig());
};

/**
 * @brief Serialize a config as a small JSON document
 */
std::string tileCacheConfigToJson(const TileCacheConfig& config);

/**
 * @brief Parse a JSON document written by tileCacheConfigToJson
 *        Unknown keys are ignored, missing or unparsable keys keep defaults.
 */
TileCacheConfig tileCacheConfigFromJson(const std::string& json);

/**
 * @brief Save config to file, creating parent directories
 * @return true on success
 */
bool saveConfig(const TileCacheConfig& config, const std::filesystem::path& configPath);

/**
 * @brief Load config from file
 * @return Loaded config, or defaults if the file is missing or unreadable
 */
TileCacheConfig loadConfig(const std::filesystem::path& configPath);

#endif // TILE_CACHE_CONFIG_H
