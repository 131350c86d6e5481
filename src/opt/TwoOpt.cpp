#include "TwoOpt.hpp"
#include "../geometry.hpp"
#include "../debug.hpp"

#include <algorithm>

namespace {

// Length change from reversing positions [i, j) of an open path, j < n.
// Only the edges entering and leaving the segment are affected.
double reversalDelta(const Tour& tour, const PointSet& points, size_t i, size_t j) {
    const Coordinate& before = points[tour[i - 1]];
    const Coordinate& first = points[tour[i]];
    const Coordinate& last = points[tour[j - 1]];
    const Coordinate& after = points[tour[j]];

    return haversineDistance(before, last) + haversineDistance(first, after)
         - haversineDistance(before, first) - haversineDistance(last, after);
}

} // namespace

Tour twoOpt(Tour tour, const PointSet& points, const TwoOptOptions& options, TwoOptStats* stats) {
    TwoOptStats local;
    auto startTime = std::chrono::steady_clock::now();
    auto outOfTime = [&]() {
        return options.timeLimit.count() > 0
            && std::chrono::steady_clock::now() - startTime >= options.timeLimit;
    };

    const size_t n = tour.size();
    bool timedOut = false;
    bool improved = n > 3;
    if (!improved) local.converged = true;

    while (improved) {
        if (options.maxPasses > 0 && local.passes >= options.maxPasses) break;
        if (outOfTime()) break;

        improved = false;
        ++local.passes;
        for (size_t i = 1; i + 2 < n; ++i) {
            // Stop mid-pass too; the tour is valid after every move.
            if (outOfTime()) {
                timedOut = true;
                DBG("2-opt: time limit hit during pass " << local.passes);
                break;
            }
            for (size_t j = i + 2; j < n; ++j) {
                if (reversalDelta(tour, points, i, j) < -kImprovementEpsilon) {
                    std::reverse(tour.begin() + i, tour.begin() + j);
                    improved = true;
                    ++local.moves;
                }
            }
        }
        if (timedOut) break;
        if (!improved) local.converged = true;
    }

    DBG("2-opt: " << local.passes << " passes, " << local.moves << " moves, "
        << (local.converged ? "converged" : "budget exhausted")
        << ", length=" << routeDistance(tour, points));

    if (stats) *stats = local;
    return tour;
}
