#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "structures.hpp"

// ==================== Session state ====================

// Per-user depot. Setting a depot creates the entry on first use and
// overwrites it afterwards. Not synchronized; the owner serializes access.
class DepotStore {
public:
    void setDepot(const std::string& userId, const Coordinate& depot);
    std::optional<Coordinate> depot(const std::string& userId) const;
    bool clearDepot(const std::string& userId);
    size_t size() const { return depots.size(); }

private:
    HashMap<std::string, Coordinate> depots;
};
