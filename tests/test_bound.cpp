/// @file test_bound.cpp
/// Tests for the shared monotonic bound.

#include <gambit/bound.hpp>

#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace gambit {
namespace {

TEST(SharedBoundTest, RaiseOnlyGoesUp) {
    SharedBound bound(-kInfScore);
    EXPECT_TRUE(bound.raise(10));
    EXPECT_FALSE(bound.raise(5));
    EXPECT_FALSE(bound.raise(10));
    EXPECT_EQ(bound.load(), 10);
}

TEST(SharedBoundTest, LowerOnlyGoesDown) {
    SharedBound bound(kInfScore);
    EXPECT_TRUE(bound.lower(-3));
    EXPECT_FALSE(bound.lower(4));
    EXPECT_EQ(bound.load(), -3);
}

TEST(SharedBoundTest, TightenFollowsSide) {
    SharedBound max_bound(0);
    max_bound.tighten(Side::Maximizer, 7);
    max_bound.tighten(Side::Maximizer, 2);
    EXPECT_EQ(max_bound.load(), 7);

    SharedBound min_bound(0);
    min_bound.tighten(Side::Minimizer, -7);
    min_bound.tighten(Side::Minimizer, -2);
    EXPECT_EQ(min_bound.load(), -7);
}

TEST(SharedBoundTest, ConcurrentRaisesKeepMaximum) {
    SharedBound bound(-kInfScore);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&bound, t]() {
            for (int i = 0; i < 10000; ++i) bound.raise(i * 4 + t);
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(bound.load(), 9999 * 4 + 3);
}

}  // namespace
}  // namespace gambit
