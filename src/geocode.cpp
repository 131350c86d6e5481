#include "geocode.hpp"
#include "debug.hpp"

#include <cctype>
#include <fstream>
#include <utility>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

namespace {

// Optional '-', 1..maxIntDigits digits, '.', at least one digit
bool isDecimalLiteral(absl::string_view token, size_t maxIntDigits) {
    if (!token.empty() && token.front() == '-') token.remove_prefix(1);
    size_t dot = token.find('.');
    if (dot == absl::string_view::npos || dot == 0 || dot > maxIntDigits || dot + 1 == token.size()) {
        return false;
    }
    for (size_t i = 0; i < token.size(); ++i) {
        if (i == dot) continue;
        if (!std::isdigit(static_cast<unsigned char>(token[i]))) return false;
    }
    return true;
}

std::optional<double> parseNumber(absl::string_view text) {
    double value;
    if (!absl::SimpleAtod(absl::StripAsciiWhitespace(text), &value)) return std::nullopt;
    return value;
}

bool inRange(double lat, double lon) {
    return lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}

} // namespace

std::optional<Coordinate> CoordinateGeocoder::lookup(std::string_view query) const {
    absl::string_view text = absl::StripAsciiWhitespace(absl::string_view(query.data(), query.size()));
    if (text.empty() || text.front() == ',' || text.back() == ',') return std::nullopt;

    std::vector<absl::string_view> parts = absl::StrSplit(text, absl::ByAnyChar(", \t"), absl::SkipEmpty());
    if (parts.size() != 2) return std::nullopt;
    if (!isDecimalLiteral(parts[0], 2) || !isDecimalLiteral(parts[1], 3)) return std::nullopt;

    double lat, lon;
    if (!absl::SimpleAtod(parts[0], &lat) || !absl::SimpleAtod(parts[1], &lon)) return std::nullopt;
    if (!inRange(lat, lon)) return std::nullopt;
    return makeCoordinate(lat, lon);
}

TableGeocoder::TableGeocoder(std::string cityHint)
    : cityHint(std::move(cityHint)) {}

void TableGeocoder::add(std::string_view address, const Coordinate& c) {
    table[normalizeAddress(address)] = c;
}

std::optional<Coordinate> TableGeocoder::lookup(std::string_view query) const {
    std::string key = normalizeAddress(query);
    if (!cityHint.empty()) {
        std::string hint = normalizeAddress(cityHint);
        if (!absl::StrContains(key, hint)) {
            auto it = table.find(normalizeAddress(absl::StrCat(absl::string_view(query.data(), query.size()), ", ", cityHint)));
            if (it != table.end()) return it->second;
        }
    }
    auto it = table.find(key);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

void ChainGeocoder::append(std::unique_ptr<Geocoder> geocoder) {
    chain.push_back(std::move(geocoder));
}

std::optional<Coordinate> ChainGeocoder::lookup(std::string_view query) const {
    for (const auto& g : chain) {
        if (auto hit = g->lookup(query)) return hit;
    }
    return std::nullopt;
}

std::string normalizeAddress(std::string_view address) {
    std::vector<absl::string_view> words = absl::StrSplit(absl::string_view(address.data(), address.size()), absl::ByAnyChar(" \t\r\n"), absl::SkipEmpty());
    return absl::AsciiStrToLower(absl::StrJoin(words, " "));
}

void loadGazetteer(const std::string& path, TableGeocoder& table) {
    std::ifstream in(path);
    if (!in) throw GeocodeError("cannot open gazetteer: " + path);

    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        absl::string_view text = absl::StripAsciiWhitespace(line);
        if (text.empty() || text.front() == '#') continue;

        std::vector<absl::string_view> fields = absl::StrSplit(text, '|');
        std::optional<double> lat, lon;
        if (fields.size() == 3) {
            lat = parseNumber(fields[1]);
            lon = parseNumber(fields[2]);
        }
        if (!lat || !lon || !inRange(*lat, *lon) || absl::StripAsciiWhitespace(fields[0]).empty()) {
            throw GeocodeError(absl::StrCat(path, ":", lineNo, ": expected name|lat|lon"));
        }
        table.add(std::string_view(fields[0].data(), fields[0].size()), makeCoordinate(*lat, *lon));
    }
    DBG("Loaded " << table.size() << " gazetteer entries from " << path);
}

Coordinate geocode(const Geocoder& geocoder, std::string_view query) {
    if (auto hit = geocoder.lookup(query)) return *hit;
    throw GeocodeError(absl::StrCat("address not found: ", absl::string_view(query.data(), query.size())));
}
