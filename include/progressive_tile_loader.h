#ifndef PROGRESSIVE_TILE_LOADER_H
#define PROGRESSIVE_TILE_LOADER_H

#include "job.h"
#include "tile_id.h"
#include "tile_renderer.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

class CancellationToken;
class Document;
class JobScheduler;

enum class TileState
{
    NotLoaded = 0,
    PreviewLoaded = 1,
    CrispLoaded = 2
};

const char* tileStateName(TileState state);

/**
 * @brief Two-stage tile loading: a fast preview, then the crisp render
 *
 * State is tracked per tile position (profile-independent) and only moves
 * forward: once a tile is CrispLoaded, a late preview leaves it CrispLoaded.
 * Every published stage still reaches the callbacks, carrying the tile's
 * state after the update, so a re-delivered tile is always reported.
 *
 * Tiles can be loaded synchronously (loadTile, loadPageTiles) or queued on a
 * scheduler (submitTile, submitPage); in the latter case the worker that
 * renders a job calls publish() with the result.
 */
class ProgressiveTileLoader
{
public:
    using ProgressCallback = std::function<void(const TileId&, TileState, const RenderedTile&)>;

    explicit ProgressiveTileLoader(const TileRenderer& renderer = TileRenderer());

    // Invoked for every publication, outside the state lock
    void setProgressCallback(ProgressCallback callback);

    TileState tileState(const TileId& tileId) const;
    TileState tileState(const TileLocation& location) const;

    /**
     * Render the preview then the crisp version of one tile
     * @param callback Optional, called in addition to the progress callback
     * @return Tiles produced, preview first; shorter if cancelled
     * @throws InvalidTileError, RenderError; earlier stages keep their state
     */
    std::vector<RenderedTile> loadTile(Document& document, uint16_t pageIndex, TileCoordinate coordinate,
                                       uint32_t zoomLevel, uint16_t rotation,
                                       const ProgressCallback& callback = ProgressCallback(),
                                       const CancellationToken* token = nullptr);

    /**
     * Render every preview tile of a page, then every crisp tile
     * @throws InvalidTileError, RenderError
     */
    std::vector<RenderedTile> loadPageTiles(Document& document, uint16_t pageIndex, uint32_t zoomLevel,
                                            uint16_t rotation, const ProgressCallback& callback = ProgressCallback(),
                                            const CancellationToken* token = nullptr);

    /**
     * Queue a preview and a crisp render job for one tile at the same
     * priority, so FIFO order runs the preview first
     * @return (preview job, crisp job)
     */
    std::pair<JobId, JobId> submitTile(JobScheduler& scheduler, uint16_t pageIndex, TileCoordinate coordinate,
                                       uint32_t zoomLevel, uint16_t rotation, JobPriority priority) const;

    /**
     * Queue every preview job of a page, then every crisp job
     * @return Job ids in submission order
     * @throws InvalidTileError for a bad page
     */
    std::vector<JobId> submitPage(JobScheduler& scheduler, Document& document, uint16_t pageIndex,
                                  uint32_t zoomLevel, uint16_t rotation, JobPriority priority) const;

    /**
     * Record a rendered tile and notify the progress callback
     * @return true if the tile's state advanced (the callback runs either way)
     */
    bool publish(const RenderedTile& tile);

    void clearStates();
    size_t trackedTileCount() const;

    const TileRenderer& getRenderer() const
    {
        return m_renderer;
    }

private:
    bool publish(const RenderedTile& tile, const ProgressCallback& extraCallback);
    // (advanced, state after the update)
    std::pair<bool, TileState> advanceState(const TileLocation& location, TileState state);

    TileRenderer m_renderer;
    std::unordered_map<TileLocation, TileState> m_states;
    mutable std::mutex m_stateMutex;

    ProgressCallback m_callback;
    mutable std::mutex m_callbackMutex;
};

#endif // PROGRESSIVE_TILE_LOADER_H
