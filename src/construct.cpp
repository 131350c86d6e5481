#include "construct.hpp"
#include "debug.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

Tour nearestNeighborTour(const PointSet& points, size_t startIndex) {
    size_t n = points.size();
    if (startIndex >= n) {
        throw std::invalid_argument("start index " + std::to_string(startIndex)
                                    + " out of range for " + std::to_string(n) + " points");
    }

    Tour tour;
    tour.reserve(n);
    std::vector<bool> placed(n, false);
    tour.push_back(startIndex);
    placed[startIndex] = true;

    size_t current = startIndex;
    while (tour.size() < n) {
        size_t next = static_cast<size_t>(-1);
        double best = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < n; ++i) {
            if (placed[i]) continue;
            double d = haversineDistance(points[current], points[i]);
            if (next == static_cast<size_t>(-1) || d < best) {
                best = d;
                next = i;
            }
        }
        tour.push_back(next);
        placed[next] = true;
        current = next;
    }

    DBG("Nearest-neighbor tour over " << n << " points, length=" << routeDistance(tour, points));
    return tour;
}
