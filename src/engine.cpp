#include "engine.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

// Forward declarations of engine constructors
std::unique_ptr<SimulationEngine> create_frontier_engine();
std::unique_ptr<SimulationEngine> create_counting_engine();
std::unique_ptr<SimulationEngine> create_full_scan_engine();

std::unique_ptr<SimulationEngine> create_engine(EngineType type) {
    switch (type) {
        case EngineType::Frontier:
            return create_frontier_engine();
        case EngineType::Counting:
            return create_counting_engine();
        case EngineType::FullScan:
            return create_full_scan_engine();
    }
    // Unreachable, but satisfy compilers
    return create_frontier_engine();
}

EngineType parse_engine_type(std::string_view s) {
    // Convert to lowercase for case-insensitive comparison
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "frontier") return EngineType::Frontier;
    if (lower == "counting") return EngineType::Counting;
    if (lower == "fullscan") return EngineType::FullScan;

    throw std::invalid_argument(
        "Unknown engine type '" + std::string(s) +
        "'. Valid options: frontier, counting, fullscan");
}

const char* engine_name(EngineType type) noexcept {
    switch (type) {
        case EngineType::Frontier: return "frontier";
        case EngineType::Counting: return "counting";
        case EngineType::FullScan: return "fullscan";
    }
    return "unknown";
}
