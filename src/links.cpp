#include "links.hpp"
#include "debug.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

namespace {

const char* const kMapsBase = "https://www.google.com/maps/dir/?api=1";

std::string formatCoordinate(const Coordinate& c) {
    return absl::StrFormat("%.6f,%.6f", latitude(c), longitude(c));
}

} // namespace

std::vector<NavigationDescriptor> partitionLinks(const std::vector<Coordinate>& points, size_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }

    std::vector<NavigationDescriptor> descriptors;
    descriptors.reserve((points.size() + chunkSize - 1) / chunkSize);
    for (size_t begin = 0; begin < points.size(); begin += chunkSize) {
        size_t end = std::min(begin + chunkSize, points.size());
        NavigationDescriptor d{points[begin], points[end - 1], {}};
        if (end - begin > 2) {
            d.waypoints.assign(points.begin() + begin + 1, points.begin() + end - 1);
        }
        descriptors.push_back(std::move(d));
    }

    DBG("Partitioned " << points.size() << " points into " << descriptors.size() << " links");
    return descriptors;
}

std::string mapsDirectionsUrl(const NavigationDescriptor& descriptor) {
    std::string url = absl::StrCat(kMapsBase,
                                   "&origin=", formatCoordinate(descriptor.origin),
                                   "&destination=", formatCoordinate(descriptor.destination));
    if (!descriptor.waypoints.empty()) {
        absl::StrAppend(&url, "&waypoints=",
                        absl::StrJoin(descriptor.waypoints, "|",
                                      [](std::string* out, const Coordinate& c) {
                                          out->append(formatCoordinate(c));
                                      }));
    }
    return url;
}
