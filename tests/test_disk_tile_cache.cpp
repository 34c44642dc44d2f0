#include "disk_io_thread.h"
#include "disk_tile_cache.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <fstream>

namespace
{
constexpr size_t TILE_FILE_BYTES = DiskTileCache::HEADER_SIZE + 4 * 4 * 4;
}

TEST(DiskTileCache, FileNamesRoundTripKeys)
{
    TempDir dir;
    DiskTileCache cache(dir.path(), 1024 * 1024);

    std::filesystem::path path = cache.pathForKey(0xabcdef0123456789ULL);
    EXPECT_EQ(path.filename().string(), "abcdef0123456789.tile");
    EXPECT_EQ(DiskTileCache::keyFromFileName(path).value_or(0), 0xabcdef0123456789ULL);
    EXPECT_EQ(DiskTileCache::keyFromFileName(cache.pathForKey(7)).value_or(0), 7u);

    EXPECT_FALSE(DiskTileCache::keyFromFileName("abc.tmp").has_value());
    EXPECT_FALSE(DiskTileCache::keyFromFileName("not-hex.tile").has_value());
    EXPECT_FALSE(DiskTileCache::keyFromFileName("0123456789abcdef0.tile").has_value());
}

TEST(DiskTileCache, PutThenGet)
{
    TempDir dir;
    DiskTileCache cache(dir.path(), 1024 * 1024);

    ASSERT_TRUE(cache.put(1, solidPixels(4, 4, 0x5A), 4, 4));
    EXPECT_TRUE(std::filesystem::exists(cache.pathForKey(1)));
    EXPECT_EQ(cache.bytesUsed(), TILE_FILE_BYTES);

    std::optional<DiskCachedTile> tile = cache.get(1);
    ASSERT_TRUE(tile.has_value());
    EXPECT_EQ(tile->key, 1u);
    EXPECT_EQ(tile->width, 4u);
    EXPECT_EQ(tile->height, 4u);
    EXPECT_EQ(tile->pixels, solidPixels(4, 4, 0x5A));

    EXPECT_FALSE(cache.get(2).has_value());
    EXPECT_EQ(cache.stats().hits, 1u);
    EXPECT_EQ(cache.stats().misses, 1u);
}

TEST(DiskTileCache, RejectsMismatchedPixelBuffer)
{
    TempDir dir;
    DiskTileCache cache(dir.path(), 1024 * 1024);
    EXPECT_FALSE(cache.put(1, solidPixels(2, 2), 4, 4));
    EXPECT_FALSE(cache.contains(1));
}

TEST(DiskTileCache, EvictionDeletesFiles)
{
    TempDir dir;
    DiskTileCache cache(dir.path(), TILE_FILE_BYTES * 2);

    cache.put(1, solidPixels(4, 4), 4, 4);
    cache.put(2, solidPixels(4, 4), 4, 4);
    cache.put(3, solidPixels(4, 4), 4, 4);

    EXPECT_FALSE(cache.contains(1));
    EXPECT_FALSE(std::filesystem::exists(cache.pathForKey(1)));
    EXPECT_TRUE(std::filesystem::exists(cache.pathForKey(3)));
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST(DiskTileCache, SurvivesRestart)
{
    TempDir dir;
    {
        DiskTileCache cache(dir.path(), 1024 * 1024);
        cache.put(10, solidPixels(4, 4, 1), 4, 4);
        cache.put(11, solidPixels(4, 4, 2), 4, 4);
    }

    DiskTileCache reopened(dir.path(), 1024 * 1024);
    EXPECT_FALSE(reopened.contains(10));

    // Stray files in the directory are ignored
    std::ofstream(dir.path() / "readme.txt") << "hello";

    EXPECT_EQ(reopened.loadFromDisk(), 2u);
    EXPECT_TRUE(reopened.contains(10));
    EXPECT_EQ(reopened.bytesUsed(), TILE_FILE_BYTES * 2);

    std::optional<DiskCachedTile> tile = reopened.get(11);
    ASSERT_TRUE(tile.has_value());
    EXPECT_EQ(tile->pixels[0], 2);
}

TEST(DiskTileCache, CorruptFileIsAMiss)
{
    TempDir dir;
    DiskTileCache cache(dir.path(), 1024 * 1024);
    cache.put(1, solidPixels(4, 4), 4, 4);

    std::ofstream(cache.pathForKey(1), std::ios::binary | std::ios::trunc) << "garbage";

    EXPECT_FALSE(cache.get(1).has_value());
    EXPECT_FALSE(cache.contains(1));
    EXPECT_EQ(cache.ioErrors(), 1u);
}

TEST(DiskTileCache, HeaderSizeMismatchIsAMiss)
{
    TempDir dir;
    DiskTileCache cache(dir.path(), 1024 * 1024);
    cache.put(1, solidPixels(4, 4), 4, 4);
    cache.put(2, solidPixels(4, 4), 4, 4);

    // Claim a 0xFFFFFFFF x 0xFFFFFFFF tile in the first file, and 4 x 5 in the second
    {
        std::fstream file(cache.pathForKey(1), std::ios::binary | std::ios::in | std::ios::out);
        file.seekp(8);
        const char huge[8] = {'\xFF', '\xFF', '\xFF', '\xFF', '\xFF', '\xFF', '\xFF', '\xFF'};
        file.write(huge, sizeof(huge));
    }
    {
        std::fstream file(cache.pathForKey(2), std::ios::binary | std::ios::in | std::ios::out);
        file.seekp(12);
        const char five[4] = {5, 0, 0, 0};
        file.write(five, sizeof(five));
    }

    EXPECT_NO_THROW(EXPECT_FALSE(cache.get(1).has_value()));
    EXPECT_FALSE(cache.get(2).has_value());
    EXPECT_FALSE(cache.contains(1));
    EXPECT_FALSE(cache.contains(2));
    EXPECT_EQ(cache.ioErrors(), 2u);
}

TEST(DiskTileCache, DeletedFileIsAMiss)
{
    TempDir dir;
    DiskTileCache cache(dir.path(), 1024 * 1024);
    cache.put(1, solidPixels(4, 4), 4, 4);
    cache.put(2, solidPixels(4, 4), 4, 4);

    std::filesystem::remove(cache.pathForKey(1));
    EXPECT_FALSE(cache.get(1).has_value());
    EXPECT_FALSE(cache.contains(1));

    std::filesystem::remove(cache.pathForKey(2));
    cache.recalculateDiskUsage();
    EXPECT_FALSE(cache.contains(2));
    EXPECT_EQ(cache.bytesUsed(), 0u);
}

TEST(DiskTileCache, ClearAndRemoveDeleteFiles)
{
    TempDir dir;
    DiskTileCache cache(dir.path(), 1024 * 1024);
    cache.put(1, solidPixels(4, 4), 4, 4);
    cache.put(2, solidPixels(4, 4), 4, 4);

    EXPECT_TRUE(cache.remove(1));
    EXPECT_FALSE(cache.remove(1));
    EXPECT_FALSE(std::filesystem::exists(cache.pathForKey(1)));

    cache.clear();
    EXPECT_FALSE(std::filesystem::exists(cache.pathForKey(2)));
    EXPECT_EQ(cache.bytesUsed(), 0u);
}

TEST(DiskIoThread, ExecutesRequestsInOrder)
{
    TempDir dir;
    DiskTileCache cache(dir.path(), 1024 * 1024);
    DiskIoThread io(cache);
    io.start();

    bool written = false;
    std::optional<DiskCachedTile> readBack;
    io.write(5, solidPixels(4, 4, 9), 4, 4, [&](bool ok) { written = ok; });
    io.read(5, [&](std::optional<DiskCachedTile> tile) { readBack = std::move(tile); });
    io.flush();

    EXPECT_TRUE(written);
    ASSERT_TRUE(readBack.has_value());
    EXPECT_EQ(readBack->pixels[0], 9);

    io.remove(5);
    io.flush();
    EXPECT_FALSE(cache.contains(5));
    EXPECT_EQ(io.completedRequests(), 3u);
    EXPECT_EQ(io.pendingRequests(), 0u);
}

TEST(DiskIoThread, UnreadableTileStillAnswersTheReader)
{
    TempDir dir;
    DiskTileCache cache(dir.path(), 1024 * 1024);
    cache.put(5, solidPixels(4, 4), 4, 4);
    std::ofstream(cache.pathForKey(5), std::ios::binary | std::ios::trunc) << "PTIL";

    DiskIoThread io(cache);
    io.start();

    bool answered = false;
    io.read(5,
            [&](std::optional<DiskCachedTile> tile)
            {
                answered = true;
                EXPECT_FALSE(tile.has_value());
            });
    io.flush();

    EXPECT_TRUE(answered);
    EXPECT_FALSE(cache.contains(5));
}

TEST(DiskIoThread, StopDrainsQueueByDefault)
{
    TempDir dir;
    DiskTileCache cache(dir.path(), 1024 * 1024);
    DiskIoThread io(cache);
    io.start();

    for (CacheKey key = 1; key <= 20; ++key)
    {
        io.write(key, solidPixels(4, 4), 4, 4);
    }
    io.stop();

    EXPECT_FALSE(io.isRunning());
    EXPECT_EQ(cache.stats().entryCount, 20u);
}

TEST(DiskIoThread, DropsRequestsWhenStopped)
{
    TempDir dir;
    DiskTileCache cache(dir.path(), 1024 * 1024);
    DiskIoThread io(cache);

    bool called = false;
    io.write(1, solidPixels(4, 4), 4, 4, [&](bool) { called = true; });
    io.flush();

    EXPECT_FALSE(called);
    EXPECT_FALSE(cache.contains(1));
}
