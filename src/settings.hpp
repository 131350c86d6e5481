#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "planner.hpp"

// Simple settings structure
struct Settings {
    std::filesystem::path inputDir = "./data/stops";
    std::filesystem::path outputDir = "./data/routes";
    std::vector<std::string> filesToRead; // empty = process all
    std::optional<std::filesystem::path> logFile; // optional log file
    std::optional<std::filesystem::path> gazetteer; // optional address table
    std::string cityHint;
    size_t chunkSize = DEFAULT_CHUNK_SIZE;
    size_t maxPasses = 0; // 0 = until converged
    long long timeLimitMs = 0; // 0 = no limit

    PlannerOptions plannerOptions() const;
};

// Read settings from a file (key, then value for the rest of the line).
// A missing file yields the defaults. Throws std::invalid_argument on a bad number.
Settings loadSettings(const std::string& settingsFile);
