#include <iostream>
#include <string>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <thread>
#include "game_of_life.h"
#include "engine.h"
#include "renderer.h"
#include "seed.h"
#include "terminal.h"

namespace fs = std::filesystem;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  -f, --file FILE       Seed file: .json, .life or .lif (default: default.json)\n"
              << "  --rows N              Grid height (default: terminal height)\n"
              << "  --cols N              Grid width (default: terminal width)\n"
              << "  -n, --generations N   Stop after N generations (default: run forever)\n"
              << "  --delay MS            Delay between frames in milliseconds (default: 1000)\n"
              << "  --engine ENGINE       Transition engine: frontier (default), counting, fullscan\n"
              << "  --stats               Print per-generation changes and timing to stderr\n"
              << "  -h, --help            Show this help message\n"
              << "\n"
              << "PNG Output:\n"
              << "  --png DIR             Also save each frame as PNG to DIR\n"
              << "  --cell-size N         Pixels per cell (default: 4)\n"
              << "  --grid                Show grid lines between cells\n";
}

// Strict integer parsing - rejects trailing garbage, overflow, negative values
bool parse_positive_int(const char* str, int& result) {
    if (str == nullptr || *str == '\0') return false;

    char* end;
    errno = 0;
    long val = std::strtol(str, &end, 10);

    // Check for trailing garbage
    if (*end != '\0') return false;

    // Check for overflow
    if (errno == ERANGE || val < 0 || val > INT_MAX) return false;

    result = static_cast<int>(val);
    return true;
}

// Grid dimension: 1..65535 so every coordinate fits 16 bits
bool parse_dimension(const char* str, uint16_t& result) {
    int val = 0;
    if (!parse_positive_int(str, val) || val < 1 || val > UINT16_MAX) return false;
    result = static_cast<uint16_t>(val);
    return true;
}

int main(int argc, char* argv[]) {
    std::string seed_path = "default.json";
    std::optional<uint16_t> rows;
    std::optional<uint16_t> cols;
    int generations = -1;  // run forever
    int delay_ms = 1000;
    bool show_stats = false;
    EngineType engine_type = EngineType::Frontier;

    // PNG options
    bool render_pngs = false;
    RenderConfig render_config;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-f" || arg == "--file") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a filename argument\n";
                return 1;
            }
            seed_path = argv[++i];
        } else if (arg == "--rows" || arg == "--cols") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a number argument\n";
                return 1;
            }
            uint16_t value = 0;
            if (!parse_dimension(argv[++i], value)) {
                std::cerr << "Error: Invalid " << arg.substr(2)
                          << " (must be an integer between 1 and 65535)\n";
                return 1;
            }
            (arg == "--rows" ? rows : cols) = value;
        } else if (arg == "-n" || arg == "--generations") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a number argument\n";
                return 1;
            }
            if (!parse_positive_int(argv[++i], generations)) {
                std::cerr << "Error: Invalid generation count (must be a non-negative integer)\n";
                return 1;
            }
        } else if (arg == "--delay") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a number argument\n";
                return 1;
            }
            if (!parse_positive_int(argv[++i], delay_ms)) {
                std::cerr << "Error: Invalid delay (must be a non-negative integer)\n";
                return 1;
            }
        } else if (arg == "--engine") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an engine name argument\n";
                return 1;
            }
            try {
                engine_type = parse_engine_type(argv[++i]);
            } catch (const std::invalid_argument& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
        } else if (arg == "--stats") {
            show_stats = true;
        } else if (arg == "--png") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a directory argument\n";
                return 1;
            }
            render_config.output_dir = argv[++i];
            render_pngs = true;
        } else if (arg == "--cell-size") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a number argument\n";
                return 1;
            }
            if (!parse_positive_int(argv[++i], render_config.cell_size) ||
                render_config.cell_size < 1 || render_config.cell_size > 64) {
                std::cerr << "Error: Invalid cell size (must be an integer between 1 and 64)\n";
                return 1;
            }
        } else if (arg == "--grid") {
            render_config.show_grid = true;
        } else {
            std::cerr << "Error: Unknown argument '" << arg << "'\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Fill in missing dimensions from the terminal
    if (!rows || !cols) {
        std::optional<TerminalSize> size = query_terminal_size();
        if (!size) {
            std::cerr << "Error: Cannot detect terminal size; pass --rows and --cols\n";
            return 1;
        }
        if (!rows) rows = size->rows;
        if (!cols) cols = size->cols;
    }

    // Validate PNG output directory
    if (render_pngs && !fs::is_directory(render_config.output_dir)) {
        std::error_code ec;
        if (!fs::create_directory(render_config.output_dir, ec) && ec) {
            std::cerr << "Error: Cannot create PNG output directory '" << render_config.output_dir << "'\n";
            return 1;
        }
    }

    try {
        auto total_start = std::chrono::steady_clock::now();

        CellList seed = load_seed_file(seed_path);
        GameOfLife game(seed, *rows, *cols, engine_type);
        size_t initial_cells = game.count();

        if (show_stats) {
            std::cerr << "🧬 Game of Life Simulation\n";
            std::cerr << "━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
            std::cerr << "📥 Seed:       " << seed_path << " (" << initial_cells << " cells)\n";
            std::cerr << "📐 Grid:       " << game.rows() << " x " << game.cols() << "\n";
            std::cerr << "⚙️  Engine:     " << engine_name(game.engine_type()) << "\n";
            if (generations >= 0) {
                std::cerr << "🔄 Generations: " << generations << "\n";
            }
            if (render_pngs) {
                std::cerr << "🖼️  PNG:        " << render_config.output_dir << "/\n";
            }
            std::cerr << "━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
        }

        auto render = [&]() {
            write_frame(game.render_view(), std::cout);
            std::cout.flush();
            if (render_pngs) {
                if (!render_png(game.render_view(), render_config, game.generation())) {
                    std::cerr << "Warning: Failed to render frame " << game.generation() << "\n";
                }
            }
        };

        const auto delay = std::chrono::milliseconds(delay_ms);
        std::chrono::steady_clock::duration step_time{};

        render();
        for (int i = 0; generations < 0 || i < generations; i++) {
            if (delay_ms > 0) {
                std::this_thread::sleep_for(delay);
            }

            auto step_start = std::chrono::steady_clock::now();
            game.step();
            step_time += std::chrono::steady_clock::now() - step_start;

            if (show_stats) {
                const Transition& t = game.last_transition();
                std::cerr << "generation " << game.generation() << ": -" << t.deaths.size()
                          << " +" << t.births.size() << " -> " << game.count() << " cells\n";
                std::cerr << "  removed:  ";
                write_cells(t.deaths, std::cerr);
                std::cerr << "\n  inserted: ";
                write_cells(t.births, std::cerr);
                std::cerr << "\n";
            }

            std::cout << '\n';
            render();
        }
        std::cout << '\n';

        auto total_end = std::chrono::steady_clock::now();

        if (show_stats) {
            auto step_ms = std::chrono::duration_cast<std::chrono::microseconds>(step_time).count() / 1000.0;
            auto total_ms = std::chrono::duration_cast<std::chrono::microseconds>(total_end - total_start).count() / 1000.0;

            std::cerr << "📊 Results\n";
            std::cerr << "━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
            std::cerr << "📤 Output:     " << game.count() << " cells\n";
            std::cerr << "⏱️  Simulate:   " << step_ms << " ms\n";
            std::cerr << "   Total:      " << total_ms << " ms (includes delays and rendering)\n";
            if (game.generation() > 0 && step_ms > 0) {
                double steps_per_sec = game.generation() / (step_ms / 1000.0);
                std::cerr << "🚀 Speed:      " << static_cast<long long>(steps_per_sec) << " steps/sec\n";
            }
            std::cerr << "━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
