#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "structures.hpp"
#include "geocode.hpp"
#include "session.hpp"
#include "links.hpp"
#include "opt/TwoOpt.hpp"

// ==================== Route planning ====================

// Raised when a request cannot be planned (no depot, no stops).
struct PlanError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct PlannerOptions {
    size_t chunkSize = DEFAULT_CHUNK_SIZE;
    TwoOptOptions twoOpt;
    std::string depotLabel = "Depot";
};

struct RoutePlan {
    std::vector<LabeledPoint> stops; // visiting order, depot first
    Tour tour;                       // indices into the request's point set
    double totalKm = 0.0;
    std::vector<NavigationDescriptor> legs;
    std::vector<std::string> links;  // one URL per leg
};

// Turns a user's depot and a list of addresses into an ordered route.
// The geocoder and depot store are owned by the caller and must outlive the planner.
class RoutePlanner {
public:
    RoutePlanner(const Geocoder& geocoder, DepotStore& depots, PlannerOptions options = {});

    Coordinate setDepot(const std::string& userId, std::string_view address);
    void setDepot(const std::string& userId, const Coordinate& location);

    // One address per line; blank lines are ignored.
    RoutePlan plan(const std::string& userId, std::string_view text) const;

    const PlannerOptions& options() const { return opts; }

private:
    const Geocoder& geocoder;
    DepotStore& depots;
    PlannerOptions opts;
};

// Stop list, one link per leg and the total distance, as plain text
std::string formatPlan(const RoutePlan& plan);
