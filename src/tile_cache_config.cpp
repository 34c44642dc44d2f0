#include "tile_cache_config.h"
#include "path_utils.h"
#include "shared_preview_cache.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>

namespace
{
constexpr size_t BYTES_PER_MB = 1024 * 1024;
constexpr size_t MAX_TILE_SIZE = 8192;

// Nothing when the byte count does not fit in size_t
std::optional<size_t> megabytesToBytes(size_t mb)
{
    if (mb > std::numeric_limits<size_t>::max() / BYTES_PER_MB)
    {
        return std::nullopt;
    }
    return mb * BYTES_PER_MB;
}

size_t checkedMegabytes(size_t mb)
{
    std::optional<size_t> bytes = megabytesToBytes(mb);
    if (!bytes)
    {
        throw ConfigError("Cache size of " + std::to_string(mb) + " MB is too large");
    }
    return *bytes;
}

std::optional<size_t> parseUnsigned(const std::string& value)
{
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
    {
        return std::nullopt;
    }
    try
    {
        return static_cast<size_t>(std::stoull(value));
    }
    catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
}

void applyEnvMegabytes(const char* name, size_t& target)
{
    const char* value = std::getenv(name);
    if (!value)
    {
        return;
    }

    std::optional<size_t> mb = parseUnsigned(value);
    std::optional<size_t> bytes = mb ? megabytesToBytes(*mb) : std::nullopt;
    if (!bytes)
    {
        throw ConfigError(std::string("Invalid value for ") + name + ": '" + value + "'");
    }
    target = *bytes;
}

std::string escapeJson(const std::string& value)
{
    std::string out;
    out.reserve(value.size());
    for (char c : value)
    {
        if (c == '"' || c == '\\')
        {
            out += '\\';
        }
        out += c;
    }
    return out;
}
} // namespace

TileCacheConfig::TileCacheConfig()
    : diskCacheDir(getDefaultTileCacheDir())
{
}

TileCacheConfig& TileCacheConfig::withRamMb(size_t mb)
{
    ramCacheBytes = checkedMegabytes(mb);
    return *this;
}

TileCacheConfig& TileCacheConfig::withGpuMb(size_t mb)
{
    gpuCacheBytes = checkedMegabytes(mb);
    return *this;
}

TileCacheConfig& TileCacheConfig::withDiskMb(size_t mb)
{
    diskCacheBytes = checkedMegabytes(mb);
    return *this;
}

TileCacheConfig& TileCacheConfig::withDiskDir(const std::filesystem::path& dir)
{
    diskCacheDir = dir;
    return *this;
}

size_t TileCacheConfig::previewBudgetBytes() const
{
    return SharedPreviewCache::previewBudgetBytes(totalMemoryBytes());
}

MemoryBudgetConfig TileCacheConfig::memoryBudget() const
{
    MemoryBudgetConfig config;
    config.totalBudget = totalMemoryBytes();
    config.withWarningThreshold(warningThreshold)
        .withCriticalThreshold(criticalThreshold)
        .withTargetUtilization(targetUtilization);
    return config;
}

TileCacheConfig TileCacheConfig::fromEnv(TileCacheConfig base)
{
    TileCacheConfig config = std::move(base);

    applyEnvMegabytes("PAGETILER_RAM_CACHE_MB", config.ramCacheBytes);
    applyEnvMegabytes("PAGETILER_GPU_CACHE_MB", config.gpuCacheBytes);
    applyEnvMegabytes("PAGETILER_DISK_CACHE_MB", config.diskCacheBytes);

    const char* dir = std::getenv("PAGETILER_CACHE_DIR");
    if (dir && dir[0] != '\0')
    {
        config.diskCacheDir = dir;
    }

    return config;
}

std::string tileCacheConfigToJson(const TileCacheConfig& config)
{
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"ramCacheMb\": " << config.ramCacheBytes / BYTES_PER_MB << ",\n";
    oss << "  \"gpuCacheMb\": " << config.gpuCacheBytes / BYTES_PER_MB << ",\n";
    oss << "  \"diskCacheMb\": " << config.diskCacheBytes / BYTES_PER_MB << ",\n";
    oss << "  \"diskCacheDir\": \"" << escapeJson(config.diskCacheDir.string()) << "\",\n";
    oss << "  \"tileSize\": " << config.tileSize << ",\n";
    oss << "  \"renderWorkers\": " << config.renderWorkers << ",\n";
    oss << "  \"warningThreshold\": " << config.warningThreshold << ",\n";
    oss << "  \"criticalThreshold\": " << config.criticalThreshold << ",\n";
    oss << "  \"targetUtilization\": " << config.targetUtilization << "\n";
    oss << "}";
    return oss.str();
}

TileCacheConfig tileCacheConfigFromJson(const std::string& json)
{
    TileCacheConfig config;

    // Raw text after "key": up to the next separator, or nullopt if absent
    auto findRawValue = [&json](const std::string& key) -> std::optional<std::string>
    {
        std::string searchKey = "\"" + key + "\":";
        size_t start = json.find(searchKey);
        if (start == std::string::npos)
            return std::nullopt;
        start = json.find_first_not_of(" \t\n\r", start + searchKey.length());
        if (start == std::string::npos)
            return std::nullopt;
        size_t end = json.find_first_of(",\n}", start);
        if (end == std::string::npos)
            return std::nullopt;
        std::string value = json.substr(start, end - start);
        size_t last = value.find_last_not_of(" \t\r");
        return last == std::string::npos ? std::string() : value.substr(0, last + 1);
    };

    auto findStringValue = [&json](const std::string& key) -> std::optional<std::string>
    {
        std::string searchKey = "\"" + key + "\":";
        size_t start = json.find(searchKey);
        if (start == std::string::npos)
            return std::nullopt;
        start = json.find('"', start + searchKey.length());
        if (start == std::string::npos)
            return std::nullopt;
        std::string value;
        for (size_t i = start + 1; i < json.size(); ++i)
        {
            if (json[i] == '\\' && i + 1 < json.size())
            {
                value += json[++i];
            }
            else if (json[i] == '"')
            {
                return value;
            }
            else
            {
                value += json[i];
            }
        }
        return std::nullopt;
    };

    auto applyMegabytes = [&](const std::string& key, size_t& target)
    {
        std::optional<std::string> raw = findRawValue(key);
        if (!raw)
            return;
        std::optional<size_t> mb = parseUnsigned(*raw);
        std::optional<size_t> bytes = mb ? megabytesToBytes(*mb) : std::nullopt;
        if (bytes)
            target = *bytes;
        else
            std::cerr << "TileCacheConfig: Ignoring invalid value for " << key << ": " << *raw << std::endl;
    };

    auto applyDouble = [&](const std::string& key, double& target)
    {
        std::optional<std::string> raw = findRawValue(key);
        if (!raw)
            return;
        try
        {
            target = std::stod(*raw);
        }
        catch (const std::exception&)
        {
            std::cerr << "TileCacheConfig: Ignoring invalid value for " << key << ": " << *raw << std::endl;
        }
    };

    applyMegabytes("ramCacheMb", config.ramCacheBytes);
    applyMegabytes("gpuCacheMb", config.gpuCacheBytes);
    applyMegabytes("diskCacheMb", config.diskCacheBytes);

    if (std::optional<std::string> dir = findStringValue("diskCacheDir"))
    {
        if (!dir->empty())
        {
            config.diskCacheDir = *dir;
        }
    }

    if (std::optional<std::string> raw = findRawValue("tileSize"))
    {
        std::optional<size_t> tileSize = parseUnsigned(*raw);
        if (tileSize && *tileSize > 0 && *tileSize <= MAX_TILE_SIZE)
        {
            config.tileSize = static_cast<uint32_t>(*tileSize);
        }
        else
        {
            std::cerr << "TileCacheConfig: Ignoring invalid value for tileSize: " << *raw << std::endl;
        }
    }

    if (std::optional<std::string> raw = findRawValue("renderWorkers"))
    {
        std::optional<size_t> workers = parseUnsigned(*raw);
        if (workers)
        {
            config.renderWorkers = *workers;
        }
    }

    applyDouble("warningThreshold", config.warningThreshold);
    applyDouble("criticalThreshold", config.criticalThreshold);
    applyDouble("targetUtilization", config.targetUtilization);

    return config;
}

bool saveConfig(const TileCacheConfig& config, const std::filesystem::path& configPath)
{
    try
    {
        if (configPath.has_parent_path())
        {
            std::filesystem::create_directories(configPath.parent_path());
        }

        std::ofstream file(configPath);
        if (!file.is_open())
        {
            std::cerr << "TileCacheConfig: Failed to open config file for writing: " << configPath << std::endl;
            return false;
        }

        file << tileCacheConfigToJson(config);
        file.close();
        if (!file)
        {
            std::cerr << "TileCacheConfig: Failed to write config file: " << configPath << std::endl;
            return false;
        }

        std::cout << "TileCacheConfig: Configuration saved to: " << configPath << std::endl;
        return true;
    }
    catch (const std::exception& e)
    {
        std::cerr << "TileCacheConfig: Error saving config: " << e.what() << std::endl;
        return false;
    }
}

TileCacheConfig loadConfig(const std::filesystem::path& configPath)
{
    TileCacheConfig defaultConfig;

    try
    {
        if (!std::filesystem::exists(configPath))
        {
            std::cout << "TileCacheConfig: Config file not found, using defaults: " << configPath << std::endl;
            return defaultConfig;
        }

        std::ifstream file(configPath);
        if (!file.is_open())
        {
            std::cerr << "TileCacheConfig: Failed to open config file: " << configPath << std::endl;
            return defaultConfig;
        }

        std::string json((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        file.close();

        TileCacheConfig config = tileCacheConfigFromJson(json);
        std::cout << "TileCacheConfig: Configuration loaded from: " << configPath << std::endl;
        return config;
    }
    catch (const std::exception& e)
    {
        std::cerr << "TileCacheConfig: Error loading config: " << e.what() << std::endl;
        return defaultConfig;
    }
}
