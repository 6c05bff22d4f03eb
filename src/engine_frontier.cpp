#include "engine.h"

// Evaluates only the live cells and the dead cells bordering them, so a sparse
// population costs roughly linear time in its size rather than rows * cols.
class FrontierEngine : public SimulationEngine {
public:
    void compute(const Grid& grid, const CellList& live, Transition& out) override {
        out.clear();

        // 1. Collect dead neighbors of live cells, each one once
        candidates_.clear();
        candidates_.reserve(live.size() * 3);
        for (const auto& cell : live) {
            grid.for_each_neighbor(cell, [&](const Cell& neighbor) {
                if (!grid.alive(neighbor)) {
                    candidates_.insert(neighbor);
                }
            });
        }

        // 2. Birth: exactly 3 live neighbors
        for (const auto& cell : candidates_) {
            if (grid.live_neighbors(cell) == 3) {
                out.births.push_back(cell);
            }
        }

        // 3. Death: under- or overpopulation
        for (const auto& cell : live) {
            int count = grid.live_neighbors(cell);
            if (count < 2 || count > 3) {
                out.deaths.push_back(cell);
            }
        }
    }

    [[nodiscard]] std::unique_ptr<SimulationEngine> clone() const override {
        return std::make_unique<FrontierEngine>();
    }

    [[nodiscard]] EngineType type() const noexcept override {
        return EngineType::Frontier;
    }

private:
    CellSet candidates_;
};

std::unique_ptr<SimulationEngine> create_frontier_engine() {
    return std::make_unique<FrontierEngine>();
}
