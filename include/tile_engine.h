#ifndef TILE_ENGINE_H
#define TILE_ENGINE_H

#include "cancellation.h"
#include "job.h"
#include "job_scheduler.h"
#include "progressive_tile_loader.h"
#include "shared_preview_cache.h"
#include "tile_cache_config.h"
#include "tile_id.h"
#include "tile_renderer.h"
#include "tiered_tile_cache.h"
#include "viewport_priority.h"
#include "worker_pool.h"

#include <SDL.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

class Document;

/**
 * @brief Owns and wires the tiling core for one open document
 *
 * Render workers take every job except LoadFile; a single I/O thread takes
 * LoadFile jobs. RenderTile results are stored in the tiered cache and
 * published through the progressive loader. A RenderTile job whose tile is
 * still cached in any tier publishes the cached pixels instead of rendering.
 * Thumbnails go to the shared preview cache. OCR, text extraction and file
 * loads are handed to the external handler, if one is set.
 *
 * Everything except uploadVisibleTiles() may be called from any thread.
 */
class TileEngine
{
public:
    using ExternalJobHandler = std::function<void(const Job&, const CancellationToken&)>;

    TileEngine(const TileCacheConfig& config, Document& document);
    ~TileEngine();

    TileEngine(const TileEngine&) = delete;
    TileEngine& operator=(const TileEngine&) = delete;

    void setExternalJobHandler(ExternalJobHandler handler);
    void setProgressCallback(ProgressiveTileLoader::ProgressCallback callback);

    /**
     * Queue the preview and crisp render of one tile
     * @return (preview job, crisp job)
     */
    std::pair<JobId, JobId> requestTile(uint16_t pageIndex, TileCoordinate coordinate, uint32_t zoomLevel,
                                        uint16_t rotation, JobPriority priority);

    // Every tile of a page, previews first
    std::vector<JobId> requestPage(uint16_t pageIndex, uint32_t zoomLevel, uint16_t rotation, JobPriority priority);

    JobId requestThumbnail(uint16_t pageIndex, uint32_t width, uint32_t height);

    /**
     * Re-prioritize for a new viewport: drops queued work that scrolled
     * out of view and protects the previews of nearby pages
     * @return Number of jobs cancelled
     */
    size_t updateViewport(const Viewport& viewport);

    /**
     * Block until every submitted job has completed or been cancelled and
     * pending disk writes are done
     * @return false on timeout
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    /**
     * Copy the given tiles from RAM into the GPU tier and enforce the full
     * budget. UI thread only.
     * @return Number of tiles resident on the GPU afterwards
     */
    size_t uploadVisibleTiles(SDL_Renderer* renderer, const std::vector<TileId>& tileIds);

    // Cancel all queued work and forget progressive state and previews
    void resetDocumentState();

    JobScheduler& scheduler()
    {
        return m_scheduler;
    }
    TieredTileCache& cache()
    {
        return m_cache;
    }
    SharedPreviewCache& previewCache()
    {
        return m_previewCache;
    }
    ProgressiveTileLoader& loader()
    {
        return m_loader;
    }
    const TileRenderer& renderer() const
    {
        return m_renderer;
    }

    WorkerPoolStats renderPoolStats() const;
    WorkerPoolStats ioPoolStats() const;

    // Results discarded because their job was cancelled mid-render
    uint64_t discardedResults() const
    {
        return m_discardedResults.load();
    }

private:
    void executeJob(const Job& job, const CancellationToken& token);
    void renderTileJob(const RenderTileJob& job, JobPriority priority, const CancellationToken& token);
    void generateThumbnail(const GenerateThumbnailJob& job, const CancellationToken& token);
    void forwardToHandler(const Job& job, const CancellationToken& token);
    // Deliver a cached tile, falling back to a new render job if it is gone
    void publishCached(const TileId& tileId, const RenderTileJob& job, JobPriority priority);

    Document& m_document;
    TileCacheConfig m_config;
    TileRenderer m_renderer;
    JobScheduler m_scheduler;
    TieredTileCache m_cache;
    SharedPreviewCache m_previewCache;
    ProgressiveTileLoader m_loader;

    ExternalJobHandler m_externalHandler;
    std::mutex m_handlerMutex;
    std::atomic<uint64_t> m_discardedResults{0};

    // Last so workers stop before anything they use is destroyed
    std::unique_ptr<WorkerPool> m_renderPool;
    std::unique_ptr<WorkerPool> m_ioPool;
};

#endif // TILE_ENGINE_H
