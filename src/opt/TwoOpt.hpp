#pragma once

#include <chrono>
#include <cstddef>

#include "../structures.hpp"

// A move must shorten the route by more than this (km). Gains below it are
// rounding noise in the edge delta; a full recompute of both route lengths
// with a plain `<` could accept such a move on an exact tie.
constexpr double kImprovementEpsilon = 1e-12;

// Budget for the local search. Zero means unlimited.
struct TwoOptOptions {
    size_t maxPasses = 0;
    std::chrono::milliseconds timeLimit{0};
};

struct TwoOptStats {
    size_t passes = 0;
    size_t moves = 0;
    bool converged = false; // last pass found no improving move
};

// Improve an open-path tour with first-improvement 2-opt.
// Each pass tries, for i in [1, n-3] and j in [i+2, n-1], reversing tour
// positions [i, j). An improving move is applied immediately and the pass
// continues on the updated tour. Passes repeat until one finds nothing or
// the budget runs out. The first and last elements never move.
Tour twoOpt(Tour tour, const PointSet& points,
            const TwoOptOptions& options = {}, TwoOptStats* stats = nullptr);
