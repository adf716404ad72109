#include "core/Random.hpp"

#include <gtest/gtest.h>

TEST(SeedToState, MatchesFnv1a)
{
    EXPECT_EQ(SeedToState(""), 0x811c9dc5u);
    EXPECT_EQ(SeedToState("a"), 0xe40c292cu);
    EXPECT_EQ(SeedToState("foobar"), 0xbf9cf968u);
}

TEST(SeedToState, SuffixChangesState)
{
    EXPECT_NE(SeedToState("aula1"), SeedToState(std::string("aula1") + kTargetsSuffix));
    EXPECT_NE(SeedToState("aula1"), SeedToState(std::string("aula1") + kActiveSuffix));
}

TEST(Rng, KnownSequenceFromZero)
{
    Rng rng(0);
    EXPECT_DOUBLE_EQ(rng.Next(), 0.26642920868471265);
    EXPECT_DOUBLE_EQ(rng.Next(), 0.0003297457005828619);
    EXPECT_DOUBLE_EQ(rng.Next(), 0.2232720274478197);
}

TEST(Rng, SameStateSameSequence)
{
    Rng a(SeedToState("aula1"));
    Rng b(SeedToState("aula1"));
    for (int i = 0; i < 100; ++i)
    {
        const double x = a.Next();
        EXPECT_EQ(x, b.Next());
        EXPECT_GE(x, 0.0);
        EXPECT_LT(x, 1.0);
    }
}

TEST(Rng, NextIndexStaysInBounds)
{
    Rng rng(42);
    for (uint32_t bound = 1; bound < 50; ++bound)
        EXPECT_LT(rng.NextIndex(bound), bound);
    EXPECT_THROW(rng.NextIndex(0), std::invalid_argument);
}

TEST(Shuffle, ReproducibleForSeed)
{
    const std::vector<int> xs{ 0, 1, 2, 3, 4, 5, 6, 7, 8, 9 };

    EXPECT_EQ(Shuffle(xs, "seed1"), (std::vector<int>{ 9, 8, 1, 0, 4, 2, 6, 7, 3, 5 }));
    EXPECT_EQ(Shuffle(xs, "seed1"), Shuffle(xs, "seed1"));
    EXPECT_NE(Shuffle(xs, "seed1"), Shuffle(xs, "seed2"));
}

TEST(Shuffle, DoesNotTouchInputAndKeepsElements)
{
    const std::vector<int> xs{ 5, 3, 9, 1 };
    std::vector<int> out = Shuffle(xs, "x");

    EXPECT_EQ(xs, (std::vector<int>{ 5, 3, 9, 1 }));
    std::sort(out.begin(), out.end());
    EXPECT_EQ(out, (std::vector<int>{ 1, 3, 5, 9 }));
}

TEST(Shuffle, EmptyAndSingle)
{
    EXPECT_TRUE(Shuffle(std::vector<int>{}, "s").empty());
    EXPECT_EQ(Shuffle(std::vector<int>{ 7 }, "s"), std::vector<int>{ 7 });
}
