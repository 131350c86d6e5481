#include "settings.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/strip.h>

namespace {

template <typename T>
T parseNumber(const std::string& key, const std::string& value) {
    T parsed;
    if (!absl::SimpleAtoi(value, &parsed)) {
        throw std::invalid_argument(absl::StrCat("setting ", key, ": not a number: ", value));
    }
    return parsed;
}

} // namespace

PlannerOptions Settings::plannerOptions() const {
    PlannerOptions options;
    options.chunkSize = chunkSize;
    options.twoOpt.maxPasses = maxPasses;
    options.twoOpt.timeLimit = std::chrono::milliseconds(timeLimitMs);
    return options;
}

Settings loadSettings(const std::string& settingsFile) {
    Settings s;
    std::ifstream in(settingsFile);
    if (!in) {
        std::cerr << "No settings file found. Using defaults." << std::endl;
        return s;
    }

    std::string key;
    while (in >> key) {
        std::string rest;
        std::getline(in, rest);
        std::string value(absl::StripAsciiWhitespace(rest));

        if (key == "inputDir") {
            s.inputDir = value;
        } else if (key == "outputDir") {
            s.outputDir = value;
        } else if (key == "file") {
            s.filesToRead.push_back(value);
        } else if (key == "logFile") {
            s.logFile = value;
        } else if (key == "gazetteer") {
            s.gazetteer = value;
        } else if (key == "cityHint") {
            s.cityHint = value;
        } else if (key == "chunkSize") {
            s.chunkSize = parseNumber<size_t>(key, value);
            if (s.chunkSize == 0) throw std::invalid_argument("setting chunkSize: must be positive");
        } else if (key == "maxPasses") {
            s.maxPasses = parseNumber<size_t>(key, value);
        } else if (key == "timeLimitMs") {
            s.timeLimitMs = parseNumber<long long>(key, value);
        }
    }
    return s;
}
