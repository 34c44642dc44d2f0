#include "mupdf_document.h"
#include "path_utils.h"
#include "tile_cache_config.h"
#include "tile_engine.h"

#include <SDL.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace
{
void cleanupSDL(SDL_Renderer* renderer, SDL_Surface* surface)
{
    if (renderer)
    {
        SDL_DestroyRenderer(renderer);
    }
    if (surface)
    {
        SDL_FreeSurface(surface);
    }
    SDL_Quit();
}

void printCacheStats(const char* name, const CacheStats& stats)
{
    std::cout << "  " << name << ": " << stats.entryCount << " entries, " << stats.bytesUsed / 1024 << " KB of "
              << stats.bytesLimit / (1024 * 1024) << " MB, hits " << stats.hits << ", misses " << stats.misses
              << ", evictions " << stats.evictions << std::endl;
}

bool parseNumber(const char* text, unsigned long& value)
{
    char* end = nullptr;
    value = std::strtoul(text, &end, 10);
    return end != text && *end == '\0';
}
} // namespace

int main(int argc, char* argv[])
{
    if (argc < 2 || argc > 4)
    {
        std::cerr << "Usage: " << argv[0] << " <document.pdf> [page] [zoom percent]" << std::endl;
        return 1;
    }

    std::string documentPath = argv[1];
    unsigned long page = 0;
    unsigned long zoom = 100;
    if ((argc > 2 && !parseNumber(argv[2], page)) || (argc > 3 && !parseNumber(argv[3], zoom)) || zoom == 0 ||
        page > UINT16_MAX)
    {
        std::cerr << "Invalid page or zoom argument" << std::endl;
        return 1;
    }

    TileCacheConfig config;
    try
    {
        config = TileCacheConfig::fromEnv(loadConfig(getDefaultConfigPath()));
    }
    catch (const ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    MuPdfDocument document;
    if (!document.open(documentPath))
    {
        std::cerr << "Failed to open document: " << documentPath << std::endl;
        return 1;
    }
    if (static_cast<int>(page) >= document.getPageCount())
    {
        std::cerr << "Page " << page << " out of range (document has " << document.getPageCount() << " pages)"
                  << std::endl;
        return 1;
    }

    if (SDL_Init(0) < 0)
    {
        std::cerr << "SDL could not initialize! SDL_Error: " << SDL_GetError() << std::endl;
        return 1;
    }

    // Off-screen target: no window or display needed
    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, 1024, 1024, 32, SDL_PIXELFORMAT_RGBA32);
    SDL_Renderer* renderer = surface ? SDL_CreateSoftwareRenderer(surface) : nullptr;
    if (!renderer)
    {
        std::cerr << "Could not create software renderer! SDL_Error: " << SDL_GetError() << std::endl;
        cleanupSDL(renderer, surface);
        return 1;
    }

    int returnCode = 0;
    {
        TileEngine engine(config, document);

        std::atomic<size_t> previews{0};
        std::atomic<size_t> crisps{0};
        engine.setProgressCallback(
            [&previews, &crisps](const TileId&, TileState state, const RenderedTile&)
            {
                if (state == TileState::PreviewLoaded)
                {
                    ++previews;
                }
                else if (state == TileState::CrispLoaded)
                {
                    ++crisps;
                }
            });

        auto pageIndex = static_cast<uint16_t>(page);
        auto zoomLevel = static_cast<uint32_t>(zoom);

        auto started = std::chrono::steady_clock::now();
        engine.requestThumbnail(pageIndex, 160, 160);
        std::vector<JobId> jobs;
        try
        {
            jobs = engine.requestPage(pageIndex, zoomLevel, 0, JobPriority::Visible);
        }
        catch (const std::exception& e)
        {
            std::cerr << "Failed to schedule page " << page << ": " << e.what() << std::endl;
            returnCode = 1;
        }

        if (returnCode == 0 && !engine.waitUntilIdle(std::chrono::seconds(120)))
        {
            std::cerr << "Timed out waiting for tiles" << std::endl;
            returnCode = 1;
        }
        auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

        if (returnCode == 0)
        {
            auto [columns, rows] = engine.renderer().pageGrid(document, pageIndex, zoomLevel);
            uint32_t tileSize = engine.renderer().getTileSize();

            std::vector<TileId> visible;
            for (uint32_t y = 0; y < rows; ++y)
            {
                for (uint32_t x = 0; x < columns; ++x)
                {
                    visible.emplace_back(pageIndex, TileCoordinate{x, y}, zoomLevel, 0, TileProfile::Crisp);
                }
            }

            size_t uploaded = engine.uploadVisibleTiles(renderer, visible);

            SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
            SDL_RenderClear(renderer);
            for (const TileId& id : visible)
            {
                SDL_Texture* texture = engine.cache().gpu().get(id.cacheKey());
                if (!texture)
                {
                    continue;
                }
                int width = 0;
                int height = 0;
                SDL_QueryTexture(texture, nullptr, nullptr, &width, &height);
                SDL_Rect dest{static_cast<int>(id.coordinate.x * tileSize),
                              static_cast<int>(id.coordinate.y * tileSize), width, height};
                SDL_RenderCopy(renderer, texture, nullptr, &dest);
            }
            SDL_RenderPresent(renderer);

            SchedulerStats scheduler = engine.scheduler().stats();
            AggregatedCacheStats cache = engine.cache().stats();
            PreviewCacheSnapshot preview = engine.previewCache().snapshot();
            WorkerPoolStats pool = engine.renderPoolStats();

            std::cout << "Page " << page << " at " << zoom << "%: " << columns << "x" << rows << " tiles, "
                      << jobs.size() << " jobs, " << previews.load() << " previews, " << crisps.load()
                      << " crisp in " << elapsed.count() << " ms" << std::endl;
            std::cout << "Scheduler: submitted " << scheduler.jobsSubmitted << ", completed "
                      << scheduler.jobsCompleted << ", cancelled " << scheduler.jobsCancelled << ", queued "
                      << scheduler.queueSize << std::endl;
            std::cout << "Workers: executed " << pool.jobsExecuted << ", skipped " << pool.jobsSkipped
                      << ", errors " << pool.executorErrors << std::endl;
            std::cout << "Caches (pressure " << memoryPressureName(engine.cache().monitor().pressure())
                      << ", memory " << static_cast<int>(cache.memoryUtilization() * 100.0) << "%):" << std::endl;
            printCacheStats("RAM", cache.ram);
            printCacheStats("GPU", cache.gpu);
            printCacheStats("Disk", cache.disk);
            std::cout << "  Uploaded " << uploaded << " textures, spilled " << engine.cache().spilledTiles()
                      << " tiles to disk" << std::endl;
            std::cout << "  Previews: " << preview.currentBytes / 1024 << " KB (peak " << preview.peakBytes / 1024
                      << " KB), hits " << preview.hits << ", misses " << preview.misses << std::endl;

            if (pool.executorErrors > 0)
            {
                returnCode = 1;
            }
        }
    }

    cleanupSDL(renderer, surface);
    document.close();
    return returnCode;
}
