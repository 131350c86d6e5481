#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include <absl/container/flat_hash_map.h>
#include <boost/geometry.hpp>

// Choose Abseil or std hash map
#if USE_ABSEIL_HASH_MAP
template<typename K, typename V>
using HashMap = absl::flat_hash_map<K, V>;
#else
template<typename K, typename V>
using HashMap = std::unordered_map<K, V>;
#endif

namespace bg = boost::geometry;

// Points on the sphere, in degrees. Boost stores them longitude first.
typedef bg::model::point<double, 2, bg::cs::spherical_equatorial<bg::degree>> Coordinate;

// ==================== Structures ====================

inline Coordinate makeCoordinate(double lat, double lon) {
    return Coordinate(lon, lat);
}

inline double latitude(const Coordinate& c) { return bg::get<1>(c); }
inline double longitude(const Coordinate& c) { return bg::get<0>(c); }

inline bool sameCoordinate(const Coordinate& a, const Coordinate& b) {
    return latitude(a) == latitude(b) && longitude(a) == longitude(b);
}

// Index 0 is the depot.
typedef std::vector<Coordinate> PointSet;

// Visiting order: a permutation of PointSet indices, depot first.
typedef std::vector<size_t> Tour;

// A coordinate with the text it was resolved from. The label is for display only.
struct LabeledPoint {
    Coordinate point;
    std::string label;
};

/*
* One bounded navigation request: origin, destination and the
* intermediate stops of a contiguous chunk of the ordered route.
* A single-point chunk has origin == destination and no waypoints.
*/
struct NavigationDescriptor {
    Coordinate origin;
    Coordinate destination;
    std::vector<Coordinate> waypoints;
};
