#include "cancellation.h"

#include <gtest/gtest.h>

#include <thread>

TEST(CancellationToken, StartsUncancelled)
{
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
}

TEST(CancellationToken, CancelIsIdempotent)
{
    CancellationToken token;
    token.cancel();
    token.cancel();
    EXPECT_TRUE(token.isCancelled());
}

TEST(CancellationToken, CopiesShareTheFlag)
{
    CancellationToken token;
    CancellationToken copy = token;
    EXPECT_TRUE(copy.sharesStateWith(token));

    copy.cancel();
    EXPECT_TRUE(token.isCancelled());

    token.reset();
    EXPECT_FALSE(copy.isCancelled());
}

TEST(CancellationToken, FreshTokensAreIndependent)
{
    CancellationToken first;
    CancellationToken second;
    EXPECT_FALSE(first.sharesStateWith(second));

    first.cancel();
    EXPECT_FALSE(second.isCancelled());
}

TEST(CancellationToken, VisibleAcrossThreads)
{
    CancellationToken token;
    std::thread canceller([copy = token]() mutable { copy.cancel(); });
    canceller.join();
    EXPECT_TRUE(token.isCancelled());
}

TEST(CancellationRegistry, RegisterAndCancel)
{
    CancellationRegistry registry;
    CancellationToken token = registry.registerJob(1);

    EXPECT_TRUE(registry.cancel(1));
    EXPECT_TRUE(token.isCancelled());
    EXPECT_FALSE(registry.cancel(99));
}

TEST(CancellationRegistry, CancelManyCountsKnownIds)
{
    CancellationRegistry registry;
    CancellationToken a = registry.registerJob(1);
    CancellationToken b = registry.registerJob(2);
    CancellationToken c = registry.registerJob(3);

    EXPECT_EQ(registry.cancelMany({1, 3, 7}), 2u);
    EXPECT_TRUE(a.isCancelled());
    EXPECT_FALSE(b.isCancelled());
    EXPECT_TRUE(c.isCancelled());
}

TEST(CancellationRegistry, CancelAllAndClear)
{
    CancellationRegistry registry;
    CancellationToken a = registry.registerJob(1);
    CancellationToken b = registry.registerJob(2);

    EXPECT_EQ(registry.cancelAll(), 2u);
    EXPECT_TRUE(a.isCancelled());
    EXPECT_TRUE(b.isCancelled());
    EXPECT_EQ(registry.size(), 2u);

    registry.clear();
    EXPECT_TRUE(registry.empty());
}

TEST(CancellationRegistry, UnregisterAndGet)
{
    CancellationRegistry registry;
    CancellationToken token = registry.registerJob(5);

    std::optional<CancellationToken> found = registry.get(5);
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(found->sharesStateWith(token));

    EXPECT_TRUE(registry.unregister(5));
    EXPECT_FALSE(registry.unregister(5));
    EXPECT_FALSE(registry.get(5).has_value());
}
