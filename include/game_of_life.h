#ifndef GRIDLIFE_GAME_OF_LIFE_H
#define GRIDLIFE_GAME_OF_LIFE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <ankerl/unordered_dense.h>

/**
 * A cell coordinate on the bounded grid.
 * Rows and columns are unsigned 16-bit values; the owning Grid bounds them further.
 */
struct Cell {
    uint16_t row;
    uint16_t col;

    bool operator==(const Cell& other) const noexcept {
        return row == other.row && col == other.col;
    }
    bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * Hash function for Cell coordinates.
 * Packs both halves into one word, then applies a murmur-style finalizer.
 */
struct CellHash {
    using is_avalanching = void;  // Hint for ankerl::unordered_dense

    size_t operator()(const Cell& cell) const noexcept {
        uint64_t h = (static_cast<uint64_t>(cell.row) << 16) | cell.col;
        h ^= h >> 33;
        h *= 0xff51afd7ed558ccdULL;
        h ^= h >> 33;
        h *= 0xc4ceb9fe1a85ec53ULL;
        h ^= h >> 33;
        return static_cast<size_t>(h);
    }
};

// Both containers iterate in insertion order, which keeps every strategy deterministic.
using CellSet = ankerl::unordered_dense::set<Cell, CellHash>;
using CellCountMap = ankerl::unordered_dense::map<Cell, int, CellHash>;

/** Ordered list of coordinates (seeds, the live list, births, deaths). */
using CellList = std::vector<Cell>;

/**
 * Fixed-size field of dead/alive cells with hard edges.
 * Dimensions are set at construction and never change.
 */
class Grid {
public:
    /**
     * @throws std::invalid_argument if rows or cols is zero
     */
    Grid(uint16_t rows, uint16_t cols);

    uint16_t rows() const noexcept { return rows_; }
    uint16_t cols() const noexcept { return cols_; }

    /** True if (row, col) lies inside [0, rows) x [0, cols). */
    bool contains(int64_t row, int64_t col) const noexcept {
        return row >= 0 && row < rows_ && col >= 0 && col < cols_;
    }

    bool alive(uint16_t row, uint16_t col) const noexcept {
        return cells_[index(row, col)] != 0;
    }
    bool alive(const Cell& cell) const noexcept { return alive(cell.row, cell.col); }

    void set(const Cell& cell, bool alive) noexcept {
        cells_[index(cell.row, cell.col)] = alive ? 1 : 0;
    }

    /**
     * Invoke fn(Cell) for each of the up to 8 neighbors of cell that lie on the grid.
     * Neighbors past an edge do not exist; there is no wraparound.
     */
    template <typename Fn>
    void for_each_neighbor(const Cell& cell, Fn&& fn) const {
        const int row = cell.row;
        const int col = cell.col;
        for (int dr = -1; dr <= 1; ++dr) {
            const int r = row + dr;
            if (r < 0 || r >= rows_) continue;
            for (int dc = -1; dc <= 1; ++dc) {
                if (dr == 0 && dc == 0) continue;
                const int c = col + dc;
                if (c < 0 || c >= cols_) continue;
                fn(Cell{static_cast<uint16_t>(r), static_cast<uint16_t>(c)});
            }
        }
    }

    /** Count live neighbors of cell, excluding positions outside the grid. */
    int live_neighbors(const Cell& cell) const noexcept;

    /** Number of live cells (full scan). */
    size_t population() const noexcept;

    bool operator==(const Grid& other) const noexcept {
        return rows_ == other.rows_ && cols_ == other.cols_ && cells_ == other.cells_;
    }
    bool operator!=(const Grid& other) const noexcept { return !(*this == other); }

private:
    uint16_t rows_;
    uint16_t cols_;
    std::vector<uint8_t> cells_;

    size_t index(uint16_t row, uint16_t col) const noexcept {
        return static_cast<size_t>(row) * cols_ + col;
    }
};

/** Births and deaths computed against a single generation snapshot. */
struct Transition {
    CellList births;
    CellList deaths;

    void clear() noexcept {
        births.clear();
        deaths.clear();
    }
};

// Forward declaration
class SimulationEngine;
enum class EngineType;

/**
 * Conway's Game of Life on a fixed-size grid with hard edges.
 *
 * Owns the Grid and an ordered list of live coordinates and keeps them in
 * agreement: a cell is in cells() exactly when render_view() shows it alive.
 * Rule evaluation is delegated to a pluggable SimulationEngine that reads the
 * current generation and reports births and deaths; step() commits them.
 * Default engine is Frontier (candidate cells around live cells only).
 *
 * Thread safety: Not thread-safe. One owner drives step() and render_view().
 *
 * Exception safety:
 * - constructors: Strong guarantee (invalid seed or size throws, nothing is built)
 * - step()/run(): Strong guarantee per generation (allocation failure leaves the
 *   previous generation intact)
 */
class GameOfLife {
public:
    /**
     * @param seed Initial live cells; duplicates collapse into one
     * @param rows Grid height, must be > 0
     * @param cols Grid width, must be > 0
     * @param engine Transition strategy (default: Frontier)
     * @throws std::invalid_argument on a zero dimension or a seed cell outside the grid
     */
    GameOfLife(const CellList& seed, uint16_t rows, uint16_t cols);
    GameOfLife(const CellList& seed, uint16_t rows, uint16_t cols, EngineType engine);

    ~GameOfLife();

    // Copy support (uses engine->clone())
    GameOfLife(const GameOfLife& other);
    GameOfLife& operator=(const GameOfLife& other);

    // Move support
    GameOfLife(GameOfLife&& other) noexcept;
    GameOfLife& operator=(GameOfLife&& other) noexcept;

    /** Advance the simulation by exactly one generation. */
    void step();

    /**
     * Run multiple generations.
     * @param generations Number of generations to run (must be >= 0)
     * @throws std::invalid_argument if generations < 0
     */
    void run(int generations);

    /** Read-only view of the grid for renderers. */
    const Grid& render_view() const noexcept { return grid_; }

    /** Live cells; survivors keep their order, births are appended. */
    const CellList& cells() const noexcept { return live_cells_; }

    /** Get count of live cells */
    size_t count() const noexcept { return live_cells_.size(); }

    uint16_t rows() const noexcept { return grid_.rows(); }
    uint16_t cols() const noexcept { return grid_.cols(); }

    /** Number of completed step() calls. */
    uint64_t generation() const noexcept { return generation_; }

    /** Births and deaths applied by the most recent step(). Empty before the first. */
    const Transition& last_transition() const noexcept { return transition_; }

    EngineType engine_type() const noexcept;

    /** Verify that the live list is duplicate-free and matches the grid exactly. */
    [[nodiscard]] bool is_consistent() const;

private:
    Grid grid_;
    CellList live_cells_;
    std::unique_ptr<SimulationEngine> engine_;
    Transition transition_;
    uint64_t generation_ = 0;

    void apply_seed(const CellList& seed);
    void commit() noexcept;
};

#endif // GRIDLIFE_GAME_OF_LIFE_H
