#include "geometry.hpp"

double haversineDistance(const Coordinate& a, const Coordinate& b) {
    static const Haversine strategy(EARTH_RADIUS_KM);
    return bg::distance(a, b, strategy);
}

double routeDistance(const Tour& tour, const PointSet& points) {
    double totalDist = 0.0;
    for (size_t i = 0; i + 1 < tour.size(); ++i) {
        totalDist += haversineDistance(points[tour[i]], points[tour[i + 1]]);
    }
    return totalDist;
}

std::vector<Coordinate> tourCoordinates(const Tour& tour, const PointSet& points) {
    std::vector<Coordinate> ordered;
    ordered.reserve(tour.size());
    for (size_t idx : tour) {
        ordered.push_back(points[idx]);
    }
    return ordered;
}
