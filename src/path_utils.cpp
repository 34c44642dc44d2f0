#include "path_utils.h"

#include <cstdlib>
#include <filesystem>

namespace
{
const char* nonEmptyEnv(const char* name)
{
    const char* value = std::getenv(name);
    if (value && value[0] != '\0')
    {
        return value;
    }
    return nullptr;
}
} // namespace

std::filesystem::path getStateDirectory()
{
    if (const char* stateDir = nonEmptyEnv("PAGETILER_STATE_DIR"))
    {
        return std::filesystem::path(stateDir);
    }

    if (const char* xdgCache = nonEmptyEnv("XDG_CACHE_HOME"))
    {
        return std::filesystem::path(xdgCache) / "pagetiler";
    }

    if (const char* home = nonEmptyEnv("HOME"))
    {
        return std::filesystem::path(home) / ".cache" / "pagetiler";
    }

    return std::filesystem::path("cache");
}

std::filesystem::path getDefaultTileCacheDir()
{
    return getStateDirectory() / "tiles";
}

std::filesystem::path getDefaultConfigPath()
{
    return getStateDirectory() / "config.json";
}
