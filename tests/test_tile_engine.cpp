#include "disk_tile_cache.h"
#include "test_support.h"
#include "tile_engine.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>

namespace
{
constexpr std::chrono::milliseconds IDLE_TIMEOUT(10000);

TileCacheConfig engineConfig(const TempDir& dir, size_t workers = 2)
{
    TileCacheConfig config;
    config.withRamMb(16).withGpuMb(16).withDiskMb(16).withDiskDir(dir.path() / "tiles");
    config.renderWorkers = workers;
    return config;
}

TileId crispTile(uint32_t x, uint32_t y, uint16_t page = 0)
{
    return TileId(page, TileCoordinate{x, y}, 100, 0, TileProfile::Crisp);
}

// Thread-safe record of crisp deliveries
class CrispLog
{
public:
    void record(const TileId& id, TileState state, const RenderedTile& tile)
    {
        if (state != TileState::CrispLoaded || id.profile != TileProfile::Crisp)
        {
            return;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tiles.push_back(tile);
    }

    std::vector<RenderedTile> tilesFor(const TileId& id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<RenderedTile> matches;
        for (const RenderedTile& tile : m_tiles)
        {
            if (tile.id == id)
            {
                matches.push_back(tile);
            }
        }
        return matches;
    }

    std::set<std::pair<uint32_t, uint32_t>> coordinates() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::set<std::pair<uint32_t, uint32_t>> result;
        for (const RenderedTile& tile : m_tiles)
        {
            result.insert({tile.id.coordinate.x, tile.id.coordinate.y});
        }
        return result;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tiles.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<RenderedTile> m_tiles;
};
} // namespace

TEST(TileEngine, RequestPageLoadsEveryTileCrisp)
{
    TempDir dir;
    FakeDocument document({PageSize{300.0f, 300.0f}});
    TileEngine engine(engineConfig(dir), document);

    CrispLog crisp;
    engine.setProgressCallback(
        [&](const TileId& id, TileState state, const RenderedTile& tile)
        {
            EXPECT_FALSE(tile.pixels.empty());
            crisp.record(id, state, tile);
        });

    std::vector<JobId> ids = engine.requestPage(0, 100, 0, JobPriority::Visible);
    EXPECT_EQ(ids.size(), 8u);
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));

    for (uint32_t y = 0; y < 2; ++y)
    {
        for (uint32_t x = 0; x < 2; ++x)
        {
            EXPECT_EQ(engine.loader().tileState(crispTile(x, y)), TileState::CrispLoaded);
            EXPECT_TRUE(engine.cache().contains(crispTile(x, y).cacheKey()));
        }
    }
    EXPECT_EQ(crisp.coordinates().size(), 4u);
    EXPECT_EQ(engine.scheduler().stats().jobsCompleted, 8u);
}

TEST(TileEngine, EvictedTileIsDeliveredAgainFromDisk)
{
    TempDir dir;
    FakeDocument document({PageSize{200.0f, 200.0f}, PageSize{200.0f, 200.0f}, PageSize{200.0f, 200.0f},
                           PageSize{200.0f, 200.0f}});
    TileCacheConfig config = engineConfig(dir, 1);
    config.ramCacheBytes = 2 * 200 * 200 * 4;
    TileEngine engine(config, document);

    CrispLog crisp;
    engine.setProgressCallback([&](const TileId& id, TileState state, const RenderedTile& tile)
                               { crisp.record(id, state, tile); });

    engine.requestTile(0, TileCoordinate{0, 0}, 100, 0, JobPriority::Visible);
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));

    // Scroll through the next pages until page 0 leaves RAM
    for (uint16_t page = 1; page < 4; ++page)
    {
        engine.requestTile(page, TileCoordinate{0, 0}, 100, 0, JobPriority::Visible);
    }
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));

    CacheKey key = crispTile(0, 0).cacheKey();
    ASSERT_FALSE(engine.cache().ram().contains(key));
    ASSERT_TRUE(engine.cache().contains(key));
    ASSERT_EQ(engine.loader().tileState(crispTile(0, 0)), TileState::CrispLoaded);

    crisp.clear();
    int rendersBefore = document.renderCount();
    engine.requestTile(0, TileCoordinate{0, 0}, 100, 0, JobPriority::Visible);
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));

    std::vector<RenderedTile> delivered = crisp.tilesFor(crispTile(0, 0));
    ASSERT_FALSE(delivered.empty());
    EXPECT_EQ(delivered.front().width, 200u);
    EXPECT_EQ(delivered.front().pixels.size(), 200u * 200u * 4u);
    EXPECT_EQ(document.renderCount(), rendersBefore);
    EXPECT_TRUE(engine.cache().ram().contains(key));
}

TEST(TileEngine, DiskTilesOfAnotherDocumentAreNotServed)
{
    TempDir dir;
    TileCacheConfig config = engineConfig(dir, 1);
    TileId id = crispTile(0, 0);
    {
        // Same tile written by an earlier session, once unscoped and once for document 7
        DiskTileCache seeded(config.diskCacheDir, config.diskCacheBytes);
        ASSERT_TRUE(seeded.put(id.cacheKey(), solidPixels(200, 200, 0x11), 200, 200));
        ASSERT_TRUE(seeded.put(id.cacheKey(7), solidPixels(200, 200, 0x11), 200, 200));
    }

    FakeDocument document({PageSize{200.0f, 200.0f}}, 999);
    TileEngine engine(config, document);
    CrispLog crisp;
    engine.setProgressCallback([&](const TileId& tileId, TileState state, const RenderedTile& tile)
                               { crisp.record(tileId, state, tile); });

    engine.requestTile(0, TileCoordinate{0, 0}, 100, 0, JobPriority::Visible);
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));

    EXPECT_EQ(document.renderCount(), 2);
    std::vector<RenderedTile> delivered = crisp.tilesFor(id);
    ASSERT_EQ(delivered.size(), 1u);
    // Rendered pixels encode the position: the first pixel is (0, 0, page 0)
    EXPECT_EQ(delivered.front().pixels[0], 0x00);
    EXPECT_EQ(delivered.front().pixels[3], 0xFF);
}

TEST(TileEngine, CachedCrispTilesAreNotRenderedAgain)
{
    TempDir dir;
    FakeDocument document({PageSize{200.0f, 200.0f}});
    TileEngine engine(engineConfig(dir, 1), document);

    engine.requestTile(0, TileCoordinate{0, 0}, 100, 0, JobPriority::Visible);
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));
    int rendersAfterFirstLoad = document.renderCount();
    EXPECT_EQ(rendersAfterFirstLoad, 2);

    // Progressive state is forgotten but the crisp tile is still cached
    engine.resetDocumentState();
    EXPECT_EQ(engine.loader().tileState(crispTile(0, 0)), TileState::NotLoaded);

    engine.requestTile(0, TileCoordinate{0, 0}, 100, 0, JobPriority::Visible);
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));
    EXPECT_EQ(document.renderCount(), rendersAfterFirstLoad);
    EXPECT_EQ(engine.loader().tileState(crispTile(0, 0)), TileState::CrispLoaded);
}

TEST(TileEngine, CancelledRenderIsDiscarded)
{
    TempDir dir;
    FakeDocument document({PageSize{200.0f, 200.0f}});
    document.setRenderDelay(std::chrono::milliseconds(2000));
    TileEngine engine(engineConfig(dir, 1), document);

    auto [preview, crisp] = engine.requestTile(0, TileCoordinate{0, 0}, 100, 0, JobPriority::Visible);
    ASSERT_TRUE(waitFor([&] { return document.renderCount() >= 1; }));

    EXPECT_TRUE(engine.scheduler().cancelJob(crisp));
    EXPECT_TRUE(engine.scheduler().cancelJob(preview));
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));

    EXPECT_EQ(engine.discardedResults(), 1u);
    EXPECT_EQ(document.renderCount(), 1);
    EXPECT_EQ(engine.loader().tileState(crispTile(0, 0)), TileState::NotLoaded);
    EXPECT_FALSE(engine.cache().contains(crispTile(0, 0).withProfile(TileProfile::Preview).cacheKey()));
}

TEST(TileEngine, ViewportChangeCancelsOffscreenWork)
{
    TempDir dir;
    FakeDocument document({PageSize{612.0f, 792.0f}, PageSize{612.0f, 792.0f}, PageSize{612.0f, 792.0f},
                           PageSize{612.0f, 792.0f}, PageSize{612.0f, 792.0f}, PageSize{612.0f, 792.0f}});
    document.setRenderDelay(std::chrono::milliseconds(50));
    TileEngine engine(engineConfig(dir, 1), document);

    engine.requestPage(5, 100, 0, JobPriority::Margin);
    size_t cancelled = engine.updateViewport(Viewport(0, 0.0f, 0.0f, 800.0f, 600.0f, 100));

    // Page 5 is far from page 0; at most the job already running survives
    EXPECT_GE(cancelled, 23u);
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));
}

TEST(TileEngine, ThumbnailLandsInPreviewCache)
{
    TempDir dir;
    FakeDocument document({PageSize{612.0f, 792.0f}}, 77);
    TileEngine engine(engineConfig(dir), document);

    engine.requestThumbnail(0, 64, 64);
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));

    PreviewImagePtr preview = engine.previewCache().get(77, 0);
    ASSERT_TRUE(preview);
    EXPECT_LE(preview->width, 64u);
    EXPECT_LE(preview->height, 64u);
    EXPECT_EQ(preview->pixels.size(), static_cast<size_t>(preview->width) * preview->height * 4);

    engine.resetDocumentState();
    EXPECT_FALSE(engine.previewCache().contains(77, 0));
}

TEST(TileEngine, ForwardsOtherJobsToExternalHandler)
{
    TempDir dir;
    FakeDocument document;
    TileEngine engine(engineConfig(dir), document);

    std::atomic<int> ocrJobs{0};
    std::atomic<int> loadJobs{0};
    engine.setExternalJobHandler(
        [&](const Job& job, const CancellationToken&)
        {
            if (std::holds_alternative<RunOcrJob>(job.jobType))
            {
                ++ocrJobs;
            }
            else if (isLoadFileJob(job.jobType))
            {
                ++loadJobs;
            }
        });

    engine.scheduler().submit(JobPriority::Ocr, RunOcrJob{0});
    engine.scheduler().submit(JobPriority::Ocr, LoadFileJob{"next.pdf"});
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));

    EXPECT_EQ(ocrJobs.load(), 1);
    EXPECT_EQ(loadJobs.load(), 1);
    EXPECT_EQ(engine.ioPoolStats().jobsExecuted, 1u);
}

TEST(TileEngine, RenderFailuresAreCountedByTheWorkers)
{
    TempDir dir;
    FakeDocument document({PageSize{200.0f, 200.0f}});
    document.setFailRenders(true);
    TileEngine engine(engineConfig(dir, 1), document);

    engine.requestTile(0, TileCoordinate{0, 0}, 100, 0, JobPriority::Visible);
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));

    EXPECT_EQ(engine.renderPoolStats().executorErrors, 2u);
    EXPECT_EQ(engine.loader().tileState(crispTile(0, 0)), TileState::NotLoaded);
}
