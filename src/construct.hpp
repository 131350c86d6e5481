#pragma once

#include <cstddef>
#include "structures.hpp"
#include "geometry.hpp"

// ==================== Construction phase ====================

// Greedy nearest-neighbor tour starting at startIndex.
// Ties go to the lowest index. Throws std::invalid_argument if
// startIndex is not a valid index into points.
Tour nearestNeighborTour(const PointSet& points, size_t startIndex = 0);
