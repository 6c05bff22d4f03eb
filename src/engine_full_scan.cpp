#include "engine.h"

// Plain pass over every grid position. Cheaper than the frontier walk once most
// of the grid is populated, since each cell is visited exactly once.
class FullScanEngine : public SimulationEngine {
public:
    void compute(const Grid& grid, const CellList& /*live*/, Transition& out) override {
        out.clear();

        const uint16_t rows = grid.rows();
        const uint16_t cols = grid.cols();
        for (uint32_t r = 0; r < rows; ++r) {
            for (uint32_t c = 0; c < cols; ++c) {
                const Cell cell{static_cast<uint16_t>(r), static_cast<uint16_t>(c)};
                const int count = grid.live_neighbors(cell);
                if (grid.alive(cell)) {
                    if (count < 2 || count > 3) {
                        out.deaths.push_back(cell);
                    }
                } else if (count == 3) {
                    out.births.push_back(cell);
                }
            }
        }
    }

    [[nodiscard]] std::unique_ptr<SimulationEngine> clone() const override {
        return std::make_unique<FullScanEngine>();
    }

    [[nodiscard]] EngineType type() const noexcept override {
        return EngineType::FullScan;
    }
};

std::unique_ptr<SimulationEngine> create_full_scan_engine() {
    return std::make_unique<FullScanEngine>();
}
