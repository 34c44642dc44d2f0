#include "shared_preview_cache.h"
#include "test_support.h"

#include <gtest/gtest.h>

namespace
{
constexpr size_t MB = 1024 * 1024;

PreviewImage squareImage(uint32_t side)
{
    PreviewImage image;
    image.pixels = solidPixels(side, side, 0xFF);
    image.width = side;
    image.height = side;
    return image;
}
} // namespace

TEST(SharedPreviewCache, BudgetHasFloorAndCeiling)
{
    EXPECT_EQ(SharedPreviewCache::previewBudgetBytes(64 * MB), 32 * MB);
    EXPECT_EQ(SharedPreviewCache::previewBudgetBytes(8 * 1024 * MB), 192 * MB);
    EXPECT_EQ(SharedPreviewCache::previewBudgetBytes(1000 * MB), 100 * MB);
}

TEST(SharedPreviewCache, InsertGetAndEvict)
{
    SharedPreviewCache cache(10 * 1024);
    cache.insert(1, 0, squareImage(32));
    cache.insert(1, 1, squareImage(48));

    PreviewImagePtr image = cache.get(1, 1);
    ASSERT_TRUE(image);
    EXPECT_EQ(image->width, 48u);

    // 32x32 and 48x48 do not both fit in 10 KB
    EXPECT_TRUE(cache.contains(1, 1));
    EXPECT_FALSE(cache.contains(1, 0));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(SharedPreviewCache, TrimKeepsProtectedPages)
{
    SharedPreviewCache cache(48 * 48 * 4 + 8);
    cache.insert(7, 10, squareImage(48));
    cache.insert(7, 11, squareImage(48));

    cache.trimToBudget({11}, 7);
    EXPECT_TRUE(cache.contains(7, 11));
}

TEST(SharedPreviewCache, EvictionIsLruAcrossDocuments)
{
    SharedPreviewCache cache(2 * 16 * 16 * 4);
    cache.insert(7, 1, squareImage(16));
    cache.insert(9, 1, squareImage(16));
    cache.get(7, 1);
    cache.insert(7, 2, squareImage(16));

    EXPECT_TRUE(cache.contains(7, 1));
    EXPECT_FALSE(cache.contains(9, 1));
    EXPECT_TRUE(cache.contains(7, 2));
}

TEST(SharedPreviewCache, TrimWithinBudgetKeepsEverything)
{
    SharedPreviewCache cache(MB);
    cache.insert(7, 1, squareImage(16));
    cache.insert(9, 1, squareImage(16));

    cache.trimToBudget({}, 7);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(SharedPreviewCache, TracksHitsMissesAndPeak)
{
    SharedPreviewCache cache(10 * 1024);
    cache.insert(1, 0, squareImage(32));
    cache.insert(1, 1, squareImage(48));

    cache.get(1, 1);
    cache.get(1, 0);
    cache.get(2, 0);

    PreviewCacheSnapshot snapshot = cache.snapshot();
    EXPECT_EQ(snapshot.hits, 1u);
    EXPECT_EQ(snapshot.misses, 2u);
    EXPECT_EQ(snapshot.currentBytes, 48u * 48u * 4u);
    // Both images were resident for a moment before eviction
    EXPECT_EQ(snapshot.peakBytes, 32u * 32u * 4u + 48u * 48u * 4u);
}

TEST(SharedPreviewCache, ReplacingAnEntryDoesNotInflatePeak)
{
    SharedPreviewCache cache(MB);
    cache.insert(1, 0, squareImage(32));
    cache.insert(1, 0, squareImage(32));

    EXPECT_EQ(cache.snapshot().peakBytes, 32u * 32u * 4u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(SharedPreviewCache, RemoveDocumentDropsOnlyThatDocument)
{
    SharedPreviewCache cache(MB);
    cache.insert(1, 0, squareImage(8));
    cache.insert(1, 1, squareImage(8));
    cache.insert(2, 0, squareImage(8));

    EXPECT_EQ(cache.removeDocument(1), 2u);
    EXPECT_FALSE(cache.contains(1, 0));
    EXPECT_TRUE(cache.contains(2, 0));
    EXPECT_EQ(cache.removeDocument(1), 0u);
}

TEST(SharedPreviewCache, ZeroBudgetIsRaised)
{
    SharedPreviewCache cache(0);
    EXPECT_EQ(cache.limit(), 1u);
}
