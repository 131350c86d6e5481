#pragma once

#include <vector>
#include <boost/geometry.hpp>
#include <boost/geometry/strategies/spherical/distance_haversine.hpp>

#include "structures.hpp"

namespace bg = boost::geometry;

// Mean Earth radius in kilometers
constexpr double EARTH_RADIUS_KM = 6371.0;

typedef bg::strategy::distance::haversine<double> Haversine;

// ==================== Geometry helpers ====================

// Great-circle distance in kilometers
double haversineDistance(const Coordinate& a, const Coordinate& b);

// Length of the open path visiting `points` in `tour` order (no return leg)
double routeDistance(const Tour& tour, const PointSet& points);

// Coordinates of `tour` in visiting order
std::vector<Coordinate> tourCoordinates(const Tour& tour, const PointSet& points);
