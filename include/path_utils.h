#ifndef PATH_UTILS_H
#define PATH_UTILS_H

#include <filesystem>

/**
 * @brief Returns the directory used to persist tiler state (config, tiles).
 *        Respects PAGETILER_STATE_DIR, then XDG_CACHE_HOME/pagetiler, then
 *        HOME/.cache/pagetiler, falling back to ./cache. Does not create it.
 */
std::filesystem::path getStateDirectory();

/**
 * @brief Default on-disk tile cache directory (<state dir>/tiles).
 */
std::filesystem::path getDefaultTileCacheDir();

/**
 * @brief Default config file path (<state dir>/config.json).
 */
std::filesystem::path getDefaultConfigPath();

#endif // PATH_UTILS_H
