#include "opt/TwoOpt.hpp"
#include "construct.hpp"
#include "geometry.hpp"

#include <algorithm>
#include <chrono>
#include <numeric>
#include <random>
#include <gtest/gtest.h>

namespace {

// Points along the equator at the given longitudes
PointSet equator(std::initializer_list<double> lons) {
    PointSet points;
    for (double lon : lons) points.push_back(makeCoordinate(0.0, lon));
    return points;
}

PointSet randomPoints(size_t n, unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<> lat(20.4, 20.8);
    std::uniform_real_distribution<> lon(-100.6, -100.2);
    PointSet points;
    for (size_t i = 0; i < n; ++i) points.push_back(makeCoordinate(lat(gen), lon(gen)));
    return points;
}

Tour shuffledTour(size_t n, unsigned seed) {
    Tour tour(n);
    std::iota(tour.begin(), tour.end(), 0);
    std::mt19937 gen(seed);
    std::shuffle(tour.begin() + 1, tour.end(), gen);
    return tour;
}

bool isPermutation(Tour tour) {
    std::sort(tour.begin(), tour.end());
    for (size_t i = 0; i < tour.size(); ++i)
        if (tour[i] != i) return false;
    return true;
}

// Plain 2-opt: every candidate is built and its length recomputed in full
Tour referenceTwoOpt(Tour best, const PointSet& points) {
    bool improved = true;
    while (improved) {
        improved = false;
        for (size_t i = 1; i + 2 < best.size(); ++i) {
            for (size_t j = i + 1; j < best.size(); ++j) {
                if (j - i == 1) continue;
                Tour candidate = best;
                std::reverse(candidate.begin() + i, candidate.begin() + j);
                if (routeDistance(candidate, points) < routeDistance(best, points)) {
                    best = candidate;
                    improved = true;
                }
            }
        }
    }
    return best;
}

} // namespace

TEST(TwoOptTest, KeepsAlreadyGoodTour) {
    PointSet points{makeCoordinate(0, 0), makeCoordinate(0, 1), makeCoordinate(0, 2), makeCoordinate(1, 0)};
    Tour initial = nearestNeighborTour(points, 0);
    ASSERT_EQ(initial, (Tour{0, 1, 2, 3}));
    EXPECT_EQ(twoOpt(initial, points), initial);
}

TEST(TwoOptTest, ShortToursAreUnchanged) {
    PointSet two = equator({0, 1});
    EXPECT_EQ(twoOpt({0, 1}, two), (Tour{0, 1}));

    // Suboptimal, but no move exists for three points
    PointSet three = equator({0, 2, 1});
    TwoOptStats stats;
    EXPECT_EQ(twoOpt({0, 1, 2}, three, {}, &stats), (Tour{0, 1, 2}));
    EXPECT_EQ(stats.passes, 0u);
    EXPECT_TRUE(stats.converged);
}

// Reversing through the last stop would give 0,1,2,3 here, but the last
// stop is never moved; the only move left (swap 1 and 2) is a tie.
TEST(TwoOptTest, LastStopStaysInPlace) {
    PointSet points = equator({0, 3, 2, 1});
    Tour best = twoOpt({0, 1, 2, 3}, points);
    EXPECT_EQ(best, (Tour{0, 1, 2, 3}));
    EXPECT_EQ(best.back(), 3u);
}

TEST(TwoOptTest, LastStopStaysInPlaceOnRandomTours) {
    for (unsigned seed = 1; seed <= 10; ++seed) {
        PointSet points = randomPoints(15, seed);
        Tour initial = shuffledTour(points.size(), seed);
        EXPECT_EQ(twoOpt(initial, points).back(), initial.back());
    }
}

TEST(TwoOptTest, MatchesFullRecomputeReference) {
    for (unsigned seed = 1; seed <= 50; ++seed) {
        PointSet points = randomPoints(12, 1000 + seed);
        Tour initial = shuffledTour(points.size(), seed);
        EXPECT_EQ(twoOpt(initial, points), referenceTwoOpt(initial, points)) << "seed=" << seed;
    }
}

// Pass 1: (i=1, j=3) gives 0,2,1,3,4 and (i=2, j=4) then gives 0,2,3,1,4.
// Pass 2 finds nothing.
TEST(TwoOptTest, AppliesFirstImprovementWithinAPass) {
    PointSet points = equator({0, 3, 1, 2, 4});
    TwoOptStats stats;
    Tour best = twoOpt({0, 1, 2, 3, 4}, points, {}, &stats);

    EXPECT_EQ(best, (Tour{0, 2, 3, 1, 4}));
    EXPECT_NEAR(routeDistance(best, points), routeDistance({0, 2, 3, 1, 4}, points), 1e-9);
    EXPECT_EQ(stats.moves, 2u);
    EXPECT_EQ(stats.passes, 2u);
    EXPECT_TRUE(stats.converged);
}

TEST(TwoOptTest, NeverLengthensAndKeepsDepotFirst) {
    for (unsigned seed = 1; seed <= 20; ++seed) {
        PointSet points = randomPoints(5 + seed * 2, seed);
        Tour initial = shuffledTour(points.size(), seed);
        Tour best = twoOpt(initial, points);

        EXPECT_EQ(best.front(), 0u);
        EXPECT_TRUE(isPermutation(best));
        EXPECT_LE(routeDistance(best, points), routeDistance(initial, points) + 1e-9);
    }
}

TEST(TwoOptTest, ImprovesNearestNeighborTour) {
    PointSet points = randomPoints(60, 99);
    Tour initial = nearestNeighborTour(points, 0);
    Tour best = twoOpt(initial, points);
    EXPECT_LE(routeDistance(best, points), routeDistance(initial, points) + 1e-9);
    EXPECT_EQ(best.front(), 0u);
}

TEST(TwoOptTest, ResultIsAFixedPoint) {
    PointSet points = randomPoints(40, 5);
    Tour once = twoOpt(shuffledTour(points.size(), 5), points);
    TwoOptStats stats;
    Tour twice = twoOpt(once, points, {}, &stats);

    EXPECT_EQ(twice, once);
    EXPECT_NEAR(routeDistance(twice, points), routeDistance(once, points), 1e-9);
    EXPECT_EQ(stats.moves, 0u);
    EXPECT_EQ(stats.passes, 1u);
}

TEST(TwoOptTest, PassBudgetIsHonored) {
    PointSet points = randomPoints(80, 3);
    Tour initial = shuffledTour(points.size(), 3);
    TwoOptOptions options;
    options.maxPasses = 1;
    TwoOptStats stats;
    Tour best = twoOpt(initial, points, options, &stats);

    EXPECT_EQ(stats.passes, 1u);
    EXPECT_FALSE(stats.converged);
    EXPECT_EQ(best.front(), 0u);
    EXPECT_TRUE(isPermutation(best));
    EXPECT_LT(routeDistance(best, points), routeDistance(initial, points));
}

TEST(TwoOptTest, TimeBudgetStillYieldsValidTour) {
    PointSet points = randomPoints(300, 8);
    Tour initial = shuffledTour(points.size(), 8);
    TwoOptOptions options;
    options.timeLimit = std::chrono::milliseconds(1);
    Tour best = twoOpt(initial, points, options);

    EXPECT_EQ(best.front(), 0u);
    EXPECT_TRUE(isPermutation(best));
    EXPECT_LE(routeDistance(best, points), routeDistance(initial, points) + 1e-9);
}
