#ifndef GRIDLIFE_ENGINE_H
#define GRIDLIFE_ENGINE_H

#include "game_of_life.h"
#include <memory>
#include <string>
#include <string_view>

enum class EngineType {
    Frontier,
    Counting,
    FullScan
};

/**
 * Abstract base class for Game of Life transition strategies.
 * Each engine implements a different algorithm for finding the next generation.
 * compute() reads generation N from the grid and live list and reports which
 * cells are born and which die; it must not observe any generation N+1 state.
 */
class SimulationEngine {
public:
    virtual ~SimulationEngine() = default;

    /**
     * Fill out with the births and deaths that turn generation N into N+1.
     * out is cleared first. Births are dead cells with exactly 3 live neighbors;
     * deaths are live cells with fewer than 2 or more than 3.
     */
    virtual void compute(const Grid& grid, const CellList& live, Transition& out) = 0;

    /** Create a fresh engine of the same type (for GameOfLife copy semantics). */
    [[nodiscard]] virtual std::unique_ptr<SimulationEngine> clone() const = 0;

    /** Return the engine type. */
    [[nodiscard]] virtual EngineType type() const noexcept = 0;
};

/**
 * Factory: create a SimulationEngine of the given type.
 */
[[nodiscard]] std::unique_ptr<SimulationEngine> create_engine(EngineType type);

/**
 * Parse a string into an EngineType.
 * Accepts "frontier", "counting", "fullscan" (case-insensitive).
 * @throws std::invalid_argument on unrecognized string
 */
[[nodiscard]] EngineType parse_engine_type(std::string_view s);

/** Lowercase name of an engine type, as accepted by parse_engine_type(). */
[[nodiscard]] const char* engine_name(EngineType type) noexcept;

#endif // GRIDLIFE_ENGINE_H
