#include "engine.h"

class CountingEngine : public SimulationEngine {
public:
    void compute(const Grid& grid, const CellList& live, Transition& out) override {
        out.clear();
        neighbor_count_buffer_.clear();

        for (const auto& cell : live) {
            grid.for_each_neighbor(cell, [this](const Cell& neighbor) {
                ++neighbor_count_buffer_[neighbor];
            });
        }

        for (const auto& [cell, count] : neighbor_count_buffer_) {
            if (count == 3 && !grid.alive(cell)) {
                out.births.push_back(cell);
            }
        }

        // Isolated live cells never receive a count entry: treat them as 0
        for (const auto& cell : live) {
            auto it = neighbor_count_buffer_.find(cell);
            int count = (it == neighbor_count_buffer_.end()) ? 0 : it->second;
            if (count != 2 && count != 3) {
                out.deaths.push_back(cell);
            }
        }
    }

    [[nodiscard]] std::unique_ptr<SimulationEngine> clone() const override {
        return std::make_unique<CountingEngine>();
    }

    [[nodiscard]] EngineType type() const noexcept override {
        return EngineType::Counting;
    }

private:
    CellCountMap neighbor_count_buffer_;
};

std::unique_ptr<SimulationEngine> create_counting_engine() {
    return std::make_unique<CountingEngine>();
}
