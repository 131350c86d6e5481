#include "planner.hpp"
#include "construct.hpp"
#include "geometry.hpp"
#include "debug.hpp"

#include <utility>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

RoutePlanner::RoutePlanner(const Geocoder& geocoder, DepotStore& depots, PlannerOptions options)
    : geocoder(geocoder), depots(depots), opts(std::move(options)) {}

Coordinate RoutePlanner::setDepot(const std::string& userId, std::string_view address) {
    Coordinate location = geocode(geocoder, address);
    depots.setDepot(userId, location);
    return location;
}

void RoutePlanner::setDepot(const std::string& userId, const Coordinate& location) {
    depots.setDepot(userId, location);
}

RoutePlan RoutePlanner::plan(const std::string& userId, std::string_view text) const {
    std::optional<Coordinate> depot = depots.depot(userId);
    if (!depot) {
        throw PlanError("no depot set for " + userId);
    }

    PointSet points{*depot};
    std::vector<std::string> labels{opts.depotLabel};
    for (absl::string_view line : absl::StrSplit(absl::string_view(text.data(), text.size()), '\n')) {
        line = absl::StripAsciiWhitespace(line);
        if (line.empty()) continue;
        try {
            points.push_back(geocode(geocoder, std::string_view(line.data(), line.size())));
        } catch (const GeocodeError& e) {
            throw GeocodeError(absl::StrCat("could not geocode \"", line, "\": ", e.what()));
        }
        labels.emplace_back(line);
    }
    if (points.size() == 1) {
        throw PlanError("no stops given");
    }

    RoutePlan result;
    result.tour = twoOpt(nearestNeighborTour(points, 0), points, opts.twoOpt);
    result.totalKm = routeDistance(result.tour, points);
    for (size_t idx : result.tour) {
        result.stops.push_back({points[idx], labels[idx]});
    }
    result.legs = partitionLinks(tourCoordinates(result.tour, points), opts.chunkSize);
    for (const auto& leg : result.legs) {
        result.links.push_back(mapsDirectionsUrl(leg));
    }

    DBG("Planned " << points.size() << " points for " << userId << ": "
        << result.totalKm << " km in " << result.legs.size() << " legs");
    return result;
}

std::string formatPlan(const RoutePlan& plan) {
    std::string out = "Optimized stop order:";
    for (size_t k = 0; k < plan.stops.size(); ++k) {
        absl::StrAppend(&out, "\n", k + 1, ". ", plan.stops[k].label);
    }
    for (size_t k = 0; k < plan.links.size(); ++k) {
        absl::StrAppend(&out, "\n\nLeg ", k + 1, ": ", plan.links[k]);
    }
    absl::StrAppend(&out, absl::StrFormat("\n\nTotal distance: %.2f km\n", plan.totalKm));
    return out;
}
