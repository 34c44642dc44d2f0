#include "tile_engine.h"
#include "document.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>
#include <unordered_set>
#include <variant>

TileEngine::TileEngine(const TileCacheConfig& config, Document& document)
    : m_document(document), m_config(config), m_renderer(config.tileSize), m_cache(config, document.fingerprint()),
      m_previewCache(config.previewBudgetBytes()), m_loader(m_renderer)
{
    JobExecutor executor = [this](const Job& job, const CancellationToken& token) { executeJob(job, token); };
    m_renderPool =
        std::make_unique<WorkerPool>(m_scheduler, executor, WorkerPoolConfig::renderPool(config.renderWorkers));
    m_ioPool = std::make_unique<WorkerPool>(m_scheduler, executor, WorkerPoolConfig::ioThread());

    std::cout << "TileEngine: Started with " << m_renderPool->numWorkers() << " render workers, tile size "
              << m_renderer.getTileSize() << ", memory budget " << config.totalMemoryBytes() / (1024 * 1024) << " MB"
              << std::endl;
}

TileEngine::~TileEngine()
{
    m_scheduler.clear();
    m_renderPool->shutdown();
    m_ioPool->shutdown();
    m_cache.flush();
}

void TileEngine::setExternalJobHandler(ExternalJobHandler handler)
{
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_externalHandler = std::move(handler);
}

void TileEngine::setProgressCallback(ProgressiveTileLoader::ProgressCallback callback)
{
    m_loader.setProgressCallback(std::move(callback));
}

std::pair<JobId, JobId> TileEngine::requestTile(uint16_t pageIndex, TileCoordinate coordinate, uint32_t zoomLevel,
                                                uint16_t rotation, JobPriority priority)
{
    return m_loader.submitTile(m_scheduler, pageIndex, coordinate, zoomLevel, rotation, priority);
}

std::vector<JobId> TileEngine::requestPage(uint16_t pageIndex, uint32_t zoomLevel, uint16_t rotation,
                                           JobPriority priority)
{
    return m_loader.submitPage(m_scheduler, m_document, pageIndex, zoomLevel, rotation, priority);
}

JobId TileEngine::requestThumbnail(uint16_t pageIndex, uint32_t width, uint32_t height)
{
    return m_scheduler.submit(JobPriority::Thumbnails, GenerateThumbnailJob{pageIndex, width, height});
}

size_t TileEngine::updateViewport(const Viewport& viewport)
{
    size_t cancelled = m_scheduler.cancelOffscreenJobs(viewport, m_renderer.getTileSize());

    std::unordered_set<uint16_t> keepPages{viewport.pageIndex};
    if (viewport.pageIndex > 0)
    {
        keepPages.insert(static_cast<uint16_t>(viewport.pageIndex - 1));
    }
    keepPages.insert(static_cast<uint16_t>(viewport.pageIndex + 1));
    m_previewCache.trimToBudget(keepPages, m_document.fingerprint());

    return cancelled;
}

bool TileEngine::waitUntilIdle(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        while (m_scheduler.stats().pendingJobs() > 0)
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        // A disk read finishing here may queue a fresh render
        m_cache.flush();
        if (m_scheduler.stats().pendingJobs() == 0)
        {
            return true;
        }
    }
}

size_t TileEngine::uploadVisibleTiles(SDL_Renderer* renderer, const std::vector<TileId>& tileIds)
{
    GpuTextureCache& gpu = m_cache.gpu();

    // Keep this batch resident while the budget is enforced below
    std::vector<CacheKey> pinned;
    for (const TileId& id : tileIds)
    {
        CacheKey key = id.cacheKey();
        if (m_cache.uploadToGpu(renderer, key) && gpu.pin(key))
        {
            pinned.push_back(key);
        }
    }

    m_cache.enforceBudget(true);

    for (CacheKey key : pinned)
    {
        gpu.unpin(key);
    }
    return pinned.size();
}

void TileEngine::resetDocumentState()
{
    m_scheduler.clear();
    m_loader.clearStates();
    size_t dropped = m_previewCache.removeDocument(m_document.fingerprint());
    std::cout << "TileEngine: Reset document state, dropped " << dropped << " previews" << std::endl;
}

WorkerPoolStats TileEngine::renderPoolStats() const
{
    return m_renderPool->stats();
}

WorkerPoolStats TileEngine::ioPoolStats() const
{
    return m_ioPool->stats();
}

void TileEngine::executeJob(const Job& job, const CancellationToken& token)
{
    if (const auto* render = std::get_if<RenderTileJob>(&job.jobType))
    {
        renderTileJob(*render, job.priority, token);
    }
    else if (const auto* thumbnail = std::get_if<GenerateThumbnailJob>(&job.jobType))
    {
        generateThumbnail(*thumbnail, token);
    }
    else
    {
        forwardToHandler(job, token);
    }
}

void TileEngine::renderTileJob(const RenderTileJob& job, JobPriority priority, const CancellationToken& token)
{
    TileId id(job.pageIndex, TileCoordinate{job.tileX, job.tileY}, job.zoomLevel, job.rotation,
              job.isPreview ? TileProfile::Preview : TileProfile::Crisp);

    // Earlier renders are delivered again from RAM or disk; progressive
    // state outlives eviction, so it cannot tell whether the UI still has
    // the pixels
    TileId crispId = id.withProfile(TileProfile::Crisp);
    if (m_cache.contains(crispId.cacheKey()))
    {
        publishCached(crispId, job, priority);
        return;
    }
    if (job.isPreview)
    {
        if (m_cache.contains(id.cacheKey()))
        {
            publishCached(id, job, priority);
            return;
        }
        // Crisp pixels were dropped from every tier; the crisp job queued
        // behind this one renders them again
        if (m_loader.tileState(id) == TileState::CrispLoaded)
        {
            return;
        }
    }

    std::optional<RenderedTile> tile = m_renderer.renderTile(m_document, id, &token);
    if (!tile || token.isCancelled())
    {
        ++m_discardedResults;
        return;
    }

    m_cache.store(*tile);
    if (!job.isPreview || m_loader.tileState(id) != TileState::CrispLoaded)
    {
        m_loader.publish(*tile);
    }

    if (m_cache.monitor().needsEviction())
    {
        m_cache.enforceBudget(false);
    }
}

void TileEngine::generateThumbnail(const GenerateThumbnailJob& job, const CancellationToken& token)
{
    uint64_t fingerprint = m_document.fingerprint();
    if (m_previewCache.contains(fingerprint, job.pageIndex) || job.width == 0 || job.height == 0)
    {
        return;
    }

    PageSize size = m_document.getPageSize(job.pageIndex);
    if (size.width <= 0.0f || size.height <= 0.0f)
    {
        return;
    }

    double fit = std::min(static_cast<double>(job.width) / size.width, static_cast<double>(job.height) / size.height);
    auto zoomLevel = static_cast<uint32_t>(std::max(1.0, std::floor(fit * 100.0)));
    auto [width, height] = m_renderer.zoomedPageSize(size.width, size.height, zoomLevel);
    if (width == 0 || height == 0)
    {
        return;
    }

    RegionRequest request;
    request.pageIndex = job.pageIndex;
    request.zoomLevel = zoomLevel;
    request.width = width;
    request.height = height;
    request.profile = TileProfile::Preview;

    std::optional<std::vector<uint8_t>> pixels = m_document.renderRegion(request, &token);
    if (!pixels || token.isCancelled())
    {
        ++m_discardedResults;
        return;
    }

    PreviewImage image;
    image.pixels = std::move(*pixels);
    image.width = width;
    image.height = height;
    m_previewCache.insert(fingerprint, job.pageIndex, std::move(image));
}

void TileEngine::forwardToHandler(const Job& job, const CancellationToken& token)
{
    ExternalJobHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_externalHandler;
    }
    if (handler)
    {
        handler(job, token);
    }
}

void TileEngine::publishCached(const TileId& tileId, const RenderTileJob& job, JobPriority priority)
{
    m_cache.fetch(tileId.cacheKey(),
                  [this, tileId, job, priority](CachedTilePtr cached)
                  {
                      if (!cached)
                      {
                          // Lost between the lookup and the read; render it again
                          m_scheduler.submit(priority, job);
                          return;
                      }
                      RenderedTile tile;
                      tile.id = tileId;
                      tile.pixels = cached->pixels;
                      tile.width = cached->width;
                      tile.height = cached->height;
                      m_loader.publish(tile);
                  });
}
