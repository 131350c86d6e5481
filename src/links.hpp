#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "structures.hpp"

// ==================== Navigation links ====================

// Default number of coordinates per navigation request
constexpr size_t DEFAULT_CHUNK_SIZE = 10;

// Split an ordered route into contiguous, non-overlapping chunks of at most
// chunkSize coordinates and describe each chunk as origin, destination and
// waypoints. Throws std::invalid_argument if chunkSize is zero.
std::vector<NavigationDescriptor> partitionLinks(const std::vector<Coordinate>& points,
                                                 size_t chunkSize = DEFAULT_CHUNK_SIZE);

// Google Maps directions URL for one descriptor
std::string mapsDirectionsUrl(const NavigationDescriptor& descriptor);
