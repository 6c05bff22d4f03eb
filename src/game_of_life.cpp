#include "game_of_life.h"
#include "engine.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

// --- Grid ---

Grid::Grid(uint16_t rows, uint16_t cols)
    : rows_(rows), cols_(cols) {
    if (rows == 0 || cols == 0) {
        throw std::invalid_argument(
            "Grid dimensions must be positive (got " + std::to_string(rows) +
            " x " + std::to_string(cols) + ")");
    }
    cells_.assign(static_cast<size_t>(rows) * cols, 0);
}

int Grid::live_neighbors(const Cell& cell) const noexcept {
    int count = 0;
    for_each_neighbor(cell, [&](const Cell& neighbor) {
        if (alive(neighbor)) {
            ++count;
        }
    });
    return count;
}

size_t Grid::population() const noexcept {
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), uint8_t{1}));
}

// --- Constructors ---

GameOfLife::GameOfLife(const CellList& seed, uint16_t rows, uint16_t cols)
    : GameOfLife(seed, rows, cols, EngineType::Frontier) {}

GameOfLife::GameOfLife(const CellList& seed, uint16_t rows, uint16_t cols, EngineType engine)
    : grid_(rows, cols), engine_(create_engine(engine)) {
    apply_seed(seed);
}

GameOfLife::~GameOfLife() = default;

// --- Copy ---

GameOfLife::GameOfLife(const GameOfLife& other)
    : grid_(other.grid_),
      live_cells_(other.live_cells_),
      engine_(other.engine_ ? other.engine_->clone() : create_engine(EngineType::Frontier)),
      transition_(other.transition_),
      generation_(other.generation_) {}

GameOfLife& GameOfLife::operator=(const GameOfLife& other) {
    if (this != &other) {
        // Copy into temporaries first so a throwing allocation leaves *this untouched
        Grid grid = other.grid_;
        CellList live_cells = other.live_cells_;
        Transition transition = other.transition_;
        std::unique_ptr<SimulationEngine> engine =
            other.engine_ ? other.engine_->clone() : create_engine(EngineType::Frontier);

        grid_ = std::move(grid);
        live_cells_ = std::move(live_cells);
        transition_ = std::move(transition);
        engine_ = std::move(engine);
        generation_ = other.generation_;
    }
    return *this;
}

// --- Move ---

GameOfLife::GameOfLife(GameOfLife&& other) noexcept
    : grid_(std::move(other.grid_)),
      live_cells_(std::move(other.live_cells_)),
      engine_(std::move(other.engine_)),
      transition_(std::move(other.transition_)),
      generation_(other.generation_) {}

GameOfLife& GameOfLife::operator=(GameOfLife&& other) noexcept {
    if (this != &other) {
        grid_ = std::move(other.grid_);
        live_cells_ = std::move(other.live_cells_);
        engine_ = std::move(other.engine_);
        transition_ = std::move(other.transition_);
        generation_ = other.generation_;
    }
    return *this;
}

// --- Seeding ---

void GameOfLife::apply_seed(const CellList& seed) {
    // Validate everything before touching the grid
    for (const auto& cell : seed) {
        if (!grid_.contains(cell.row, cell.col)) {
            throw std::invalid_argument(
                "Seed cell (" + std::to_string(cell.row) + ", " + std::to_string(cell.col) +
                ") lies outside the " + std::to_string(grid_.rows()) + " x " +
                std::to_string(grid_.cols()) + " grid");
        }
    }

    live_cells_.reserve(seed.size());
    for (const auto& cell : seed) {
        if (!grid_.alive(cell)) {
            grid_.set(cell, true);
            live_cells_.push_back(cell);
        }
    }
}

// --- Simulation ---

void GameOfLife::step() {
    engine_->compute(grid_, live_cells_, transition_);
    // Only allocation left in the commit; do it before any cell changes
    live_cells_.reserve(live_cells_.size() + transition_.births.size());
    commit();
    ++generation_;
}

void GameOfLife::commit() noexcept {
    for (const auto& cell : transition_.deaths) {
        grid_.set(cell, false);
    }
    if (!transition_.deaths.empty()) {
        live_cells_.erase(
            std::remove_if(live_cells_.begin(), live_cells_.end(),
                           [this](const Cell& cell) { return !grid_.alive(cell); }),
            live_cells_.end());
    }

    for (const auto& cell : transition_.births) {
        grid_.set(cell, true);
        live_cells_.push_back(cell);
    }
}

void GameOfLife::run(int generations) {
    if (generations < 0) {
        throw std::invalid_argument("Generations must be non-negative");
    }
    for (int i = 0; i < generations; i++) {
        step();
    }
}

EngineType GameOfLife::engine_type() const noexcept {
    return engine_ ? engine_->type() : EngineType::Frontier;
}

bool GameOfLife::is_consistent() const {
    CellSet seen;
    seen.reserve(live_cells_.size());
    for (const auto& cell : live_cells_) {
        if (!grid_.contains(cell.row, cell.col) || !grid_.alive(cell)) {
            return false;
        }
        if (!seen.insert(cell).second) {
            return false;  // duplicate entry
        }
    }
    return grid_.population() == live_cells_.size();
}
