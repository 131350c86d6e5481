#include "session.hpp"
#include "debug.hpp"

void DepotStore::setDepot(const std::string& userId, const Coordinate& depot) {
    depots[userId] = depot;
    DBG("Depot for " << userId << " set to (" << latitude(depot) << ", " << longitude(depot) << ")");
}

std::optional<Coordinate> DepotStore::depot(const std::string& userId) const {
    auto it = depots.find(userId);
    if (it == depots.end()) return std::nullopt;
    return it->second;
}

// Returns whether a depot was stored
bool DepotStore::clearDepot(const std::string& userId) {
    return depots.erase(userId) > 0;
}
