#include "progressive_tile_loader.h"
#include "cancellation.h"
#include "document.h"
#include "job_scheduler.h"

#include <initializer_list>
#include <utility>

namespace
{
TileState stateForProfile(TileProfile profile)
{
    return profile == TileProfile::Preview ? TileState::PreviewLoaded : TileState::CrispLoaded;
}
} // namespace

const char* tileStateName(TileState state)
{
    switch (state)
    {
    case TileState::NotLoaded:
        return "NotLoaded";
    case TileState::PreviewLoaded:
        return "PreviewLoaded";
    case TileState::CrispLoaded:
        return "CrispLoaded";
    }
    return "Unknown";
}

ProgressiveTileLoader::ProgressiveTileLoader(const TileRenderer& renderer)
    : m_renderer(renderer)
{
}

void ProgressiveTileLoader::setProgressCallback(ProgressCallback callback)
{
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_callback = std::move(callback);
}

TileState ProgressiveTileLoader::tileState(const TileId& tileId) const
{
    return tileState(tileId.location());
}

TileState ProgressiveTileLoader::tileState(const TileLocation& location) const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    auto it = m_states.find(location);
    return it == m_states.end() ? TileState::NotLoaded : it->second;
}

std::vector<RenderedTile> ProgressiveTileLoader::loadTile(Document& document, uint16_t pageIndex,
                                                          TileCoordinate coordinate, uint32_t zoomLevel,
                                                          uint16_t rotation, const ProgressCallback& callback,
                                                          const CancellationToken* token)
{
    std::vector<RenderedTile> results;

    for (TileProfile profile : {TileProfile::Preview, TileProfile::Crisp})
    {
        TileId id(pageIndex, coordinate, zoomLevel, rotation, profile);
        std::optional<RenderedTile> tile = m_renderer.renderTile(document, id, token);
        if (!tile)
        {
            break;
        }
        publish(*tile, callback);
        results.push_back(std::move(*tile));
    }
    return results;
}

std::vector<RenderedTile> ProgressiveTileLoader::loadPageTiles(Document& document, uint16_t pageIndex,
                                                               uint32_t zoomLevel, uint16_t rotation,
                                                               const ProgressCallback& callback,
                                                               const CancellationToken* token)
{
    auto [columns, rows] = m_renderer.pageGrid(document, pageIndex, zoomLevel, rotation);

    std::vector<RenderedTile> results;
    results.reserve(static_cast<size_t>(columns) * rows * 2);

    for (TileProfile profile : {TileProfile::Preview, TileProfile::Crisp})
    {
        for (uint32_t y = 0; y < rows; ++y)
        {
            for (uint32_t x = 0; x < columns; ++x)
            {
                TileId id(pageIndex, TileCoordinate{x, y}, zoomLevel, rotation, profile);
                std::optional<RenderedTile> tile = m_renderer.renderTile(document, id, token);
                if (!tile)
                {
                    return results;
                }
                publish(*tile, callback);
                results.push_back(std::move(*tile));
            }
        }
    }
    return results;
}

std::pair<JobId, JobId> ProgressiveTileLoader::submitTile(JobScheduler& scheduler, uint16_t pageIndex,
                                                          TileCoordinate coordinate, uint32_t zoomLevel,
                                                          uint16_t rotation, JobPriority priority) const
{
    JobId preview = scheduler.submit(
        priority, RenderTileJob{pageIndex, coordinate.x, coordinate.y, zoomLevel, rotation, true});
    JobId crisp = scheduler.submit(
        priority, RenderTileJob{pageIndex, coordinate.x, coordinate.y, zoomLevel, rotation, false});
    return {preview, crisp};
}

std::vector<JobId> ProgressiveTileLoader::submitPage(JobScheduler& scheduler, Document& document,
                                                     uint16_t pageIndex, uint32_t zoomLevel, uint16_t rotation,
                                                     JobPriority priority) const
{
    auto [columns, rows] = m_renderer.pageGrid(document, pageIndex, zoomLevel, rotation);

    std::vector<JobId> jobs;
    jobs.reserve(static_cast<size_t>(columns) * rows * 2);
    for (bool isPreview : {true, false})
    {
        for (uint32_t y = 0; y < rows; ++y)
        {
            for (uint32_t x = 0; x < columns; ++x)
            {
                jobs.push_back(
                    scheduler.submit(priority, RenderTileJob{pageIndex, x, y, zoomLevel, rotation, isPreview}));
            }
        }
    }
    return jobs;
}

bool ProgressiveTileLoader::publish(const RenderedTile& tile)
{
    return publish(tile, ProgressCallback());
}

bool ProgressiveTileLoader::publish(const RenderedTile& tile, const ProgressCallback& extraCallback)
{
    auto [advanced, state] = advanceState(tile.id.location(), stateForProfile(tile.id.profile));

    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callback = m_callback;
    }
    // Every stage is delivered; a stage that lands after a better one
    // reports the state the tile already holds
    if (callback)
    {
        callback(tile.id, state, tile);
    }
    if (extraCallback)
    {
        extraCallback(tile.id, state, tile);
    }
    return advanced;
}

std::pair<bool, TileState> ProgressiveTileLoader::advanceState(const TileLocation& location, TileState state)
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    TileState& current = m_states[location];
    if (static_cast<int>(state) <= static_cast<int>(current))
    {
        return {false, current};
    }
    current = state;
    return {true, current};
}

void ProgressiveTileLoader::clearStates()
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_states.clear();
}

size_t ProgressiveTileLoader::trackedTileCount() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_states.size();
}
