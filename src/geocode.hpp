#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "structures.hpp"

// ==================== Geocoding ====================

// Raised when an address cannot be resolved or a gazetteer is malformed.
struct GeocodeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Maps free text to a coordinate. Implementations are constructed once and
// passed by reference to whoever needs to resolve addresses.
class Geocoder {
public:
    virtual ~Geocoder() = default;

    // Coordinate for query, or nothing if this geocoder cannot resolve it.
    virtual std::optional<Coordinate> lookup(std::string_view query) const = 0;
};

// Recognizes literal "lat,lon" / "lat lon" input, e.g. "20.56912,-100.42088".
// Values outside [-90, 90] x [-180, 180] are not treated as coordinates.
class CoordinateGeocoder : public Geocoder {
public:
    std::optional<Coordinate> lookup(std::string_view query) const override;
};

// Offline gazetteer keyed by normalized address text.
class TableGeocoder : public Geocoder {
public:
    explicit TableGeocoder(std::string cityHint = "");

    void add(std::string_view address, const Coordinate& c);
    size_t size() const { return table.size(); }

    // With a city hint set, "<query>, <hint>" is tried before the bare query
    // unless the query already mentions the hint.
    std::optional<Coordinate> lookup(std::string_view query) const override;

private:
    std::string cityHint;
    HashMap<std::string, Coordinate> table;
};

// Tries each geocoder in order and returns the first hit.
class ChainGeocoder : public Geocoder {
public:
    void append(std::unique_ptr<Geocoder> geocoder);
    size_t size() const { return chain.size(); }

    std::optional<Coordinate> lookup(std::string_view query) const override;

private:
    std::vector<std::unique_ptr<Geocoder>> chain;
};

// Lowercase, trim and collapse inner whitespace
std::string normalizeAddress(std::string_view address);

// Read "name|lat|lon" lines into table. Blank lines and '#' comments are skipped.
// Throws GeocodeError on unreadable files or malformed lines.
void loadGazetteer(const std::string& path, TableGeocoder& table);

// Resolve query or throw GeocodeError
Coordinate geocode(const Geocoder& geocoder, std::string_view query);
