#include "settings.hpp"
#include "planner.hpp"
#include "geocode.hpp"
#include "session.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <string>
#include <algorithm>
#include <iomanip>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <utility>

// Input file: first non-blank line is the depot, the rest are stops.
std::pair<std::string, std::string> readStopList(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open " + path.string());

    std::string depot;
    std::ostringstream stops;
    std::string line;
    while (std::getline(in, line)) {
        if (depot.empty()) {
            if (line.find_first_not_of(" \t\r") != std::string::npos) depot = line;
            continue;
        }
        stops << line << "\n";
    }
    if (depot.empty()) throw std::runtime_error("empty stop list: " + path.string());
    return {depot, stops.str()};
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    // Load settings
    const std::string settingsFile = argc > 1 ? argv[1] : "settings.txt";
    Settings settings;
    try {
        settings = loadSettings(settingsFile);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    std::cout << "Settings:\n";
    std::cout << "  Input directory: " << settings.inputDir << "\n";
    std::cout << "  Output directory: " << settings.outputDir << "\n";
    if (!settings.filesToRead.empty()) {
        std::cout << "  Files to read:\n";
        for (const auto& f : settings.filesToRead) {
            std::cout << "    " << f << "\n";
        }
    } else {
        std::cout << "  Processing all files in input directory.\n";
    }
    std::cout << "  Log file: " << (settings.logFile ? settings.logFile->string() : "stdout") << "\n";
    std::cout << "  Gazetteer: " << (settings.gazetteer ? settings.gazetteer->string() : "none") << "\n";
    std::cout << "  Chunk size: " << settings.chunkSize << "\n";
    std::cout << "  2-opt passes: " << (settings.maxPasses ? std::to_string(settings.maxPasses) : "unlimited")
              << ", time limit: " << (settings.timeLimitMs > 0 ? std::to_string(settings.timeLimitMs) + " ms" : "none")
              << "\n";

    // Set up logging
    std::ofstream logFile;
    std::ostream& logStream = [&]() -> std::ostream& {
        if (settings.logFile) {
            logFile.open(*settings.logFile); // overwrite mode
            if (logFile) {
                return logFile;
            } else {
                std::cerr << "Failed to open log file. Falling back to stdout.\n";
            }
        }
        return std::cout;
    }();

    // Geocoders: literal coordinates first, then the gazetteer
    ChainGeocoder geocoder;
    geocoder.append(std::make_unique<CoordinateGeocoder>());
    if (settings.gazetteer) {
        auto table = std::make_unique<TableGeocoder>(settings.cityHint);
        try {
            loadGazetteer(settings.gazetteer->string(), *table);
        } catch (const GeocodeError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
        logStream << "Gazetteer entries: " << table->size() << "\n";
        geocoder.append(std::move(table));
    }

    DepotStore depots;
    RoutePlanner planner(geocoder, depots, settings.plannerOptions());

    namespace fs = std::filesystem;
    if (!fs::is_directory(settings.inputDir)) {
        std::cerr << "Input directory not found: " << settings.inputDir << "\n";
        return 1;
    }
    if (!fs::exists(settings.outputDir)) {
        fs::create_directories(settings.outputDir);
    }
    logStream << "Input directory: " << settings.inputDir << "\n";
    logStream << "Output directory: " << settings.outputDir << "\n";

    // Iterate through all files in the input directory
    for (const auto& entry : fs::directory_iterator(settings.inputDir)) {
        if (!settings.filesToRead.empty()) {
            if (std::find(settings.filesToRead.begin(),
                          settings.filesToRead.end(),
                          entry.path().filename().string()) == settings.filesToRead.end()) {
                continue;
            }
        }
        if (!entry.is_regular_file()) continue;

        const fs::path inputFile = entry.path();
        const fs::path outputFile = settings.outputDir / inputFile.filename();
        const std::string userId = inputFile.stem().string();

        logStream << "Processing file: " << inputFile << "\n";

        auto startTime = std::chrono::high_resolution_clock::now();

        RoutePlan plan;
        try {
            auto [depot, stops] = readStopList(inputFile);
            planner.setDepot(userId, depot);
            plan = planner.plan(userId, stops);
        } catch (const std::exception& e) {
            logStream << "Failed to plan route for file: " << inputFile << ": " << e.what() << "\n";
            continue;
        }

        // Write the plan to the output file
        std::ofstream outFile(outputFile);
        if (!outFile) {
            logStream << "Failed to open output file: " << outputFile << "\n";
            continue;
        }
        outFile << formatPlan(plan);
        outFile.close();

        auto endTime = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();

        logStream << "Finished processing file: " << inputFile
                  << " in " << duration << " ms, stops=" << plan.stops.size()
                  << ", distance=" << std::fixed << std::setprecision(3) << plan.totalKm << " km"
                  << std::defaultfloat << "\n";
    }

    return 0;
}
