#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
#include "renderer.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

// --- Text frames ---

void write_frame(const Grid& grid, std::ostream& out) {
    // Glyphs go through a fixed buffer flushed with one write() call at a time,
    // rather than one stream insertion per cell.
    constexpr size_t kBufSize = 8192;
    constexpr size_t kGlyphLen = sizeof(kAliveGlyph) - 1;
    static_assert(sizeof(kDeadGlyph) - 1 == kGlyphLen, "glyphs must have equal width");

    char buf[kBufSize];
    char* pos = buf;
    char* const end = buf + kBufSize;

    auto flush = [&]() {
        out.write(buf, pos - buf);
        pos = buf;
    };

    const uint16_t rows = grid.rows();
    const uint16_t cols = grid.cols();
    for (uint32_t r = 0; r < rows; ++r) {
        if (r > 0) {
            if (pos == end) flush();
            *pos++ = '\n';
        }
        for (uint32_t c = 0; c < cols; ++c) {
            if (static_cast<size_t>(end - pos) < kGlyphLen) {
                flush();
            }
            const bool alive = grid.alive(static_cast<uint16_t>(r), static_cast<uint16_t>(c));
            std::memcpy(pos, alive ? kAliveGlyph : kDeadGlyph, kGlyphLen);
            pos += kGlyphLen;
        }
    }

    if (pos > buf) {
        flush();
    }
}

std::string format_frame(const Grid& grid) {
    std::ostringstream out;
    write_frame(grid, out);
    return out.str();
}

void write_cells(const CellList& cells, std::ostream& out) {
    bool first = true;
    for (const Cell& cell : cells) {
        if (!first) out << ' ';
        out << '(' << cell.row << ", " << cell.col << ')';
        first = false;
    }
}

// --- PNG frames ---

bool render_png(const Grid& grid, const RenderConfig& config, uint64_t frame_number) {
    // A cell wider than the largest image can never be drawn; this also keeps
    // the pixel arithmetic below well inside int64_t.
    if (config.cell_size < 1 || config.cell_size > std::max(config.max_width, config.max_height)) {
        return false;
    }

    const int64_t width_cells = grid.cols();
    const int64_t height_cells = grid.rows();

    // Scale down if image would be too large
    int eff_cell_size = config.cell_size;
    const int64_t cell_area = width_cells * height_cells;
    int64_t total_pixels = cell_area * eff_cell_size * eff_cell_size;
    while (total_pixels > config.max_pixels && eff_cell_size > 1) {
        eff_cell_size--;
        total_pixels = cell_area * eff_cell_size * eff_cell_size;
    }
    if (total_pixels > config.max_pixels) {
        return false;  // Even one pixel per cell is over budget
    }

    // Calculate image dimensions, clamped to max dimensions
    int img_width = static_cast<int>(std::min<int64_t>(width_cells * eff_cell_size, config.max_width));
    int img_height = static_cast<int>(std::min<int64_t>(height_cells * eff_cell_size, config.max_height));

    if (img_width <= 0 || img_height <= 0) {
        return false;
    }

    // Create image buffer (RGBA)
    std::vector<uint32_t> pixels(static_cast<size_t>(img_width) * img_height, config.dead_color);

    // Grid lines need at least one interior pixel per cell to stay readable
    const bool draw_grid = config.show_grid && eff_cell_size > 2;
    if (draw_grid) {
        for (int64_t cx = 0; cx <= width_cells; cx++) {
            int x = static_cast<int>(cx * eff_cell_size);
            if (x < img_width) {
                for (int y = 0; y < img_height; y++) {
                    pixels[static_cast<size_t>(y) * img_width + x] = config.grid_color;
                }
            }
        }
        for (int64_t cy = 0; cy <= height_cells; cy++) {
            int y = static_cast<int>(cy * eff_cell_size);
            if (y < img_height) {
                for (int x = 0; x < img_width; x++) {
                    pixels[static_cast<size_t>(y) * img_width + x] = config.grid_color;
                }
            }
        }
    }

    // With grid lines, skip the first row/column of each cell where the line is
    const int inset = draw_grid ? 1 : 0;
    for (uint32_t r = 0; r < grid.rows(); ++r) {
        const int px_start_y = static_cast<int>(r) * eff_cell_size;
        if (px_start_y >= img_height) break;
        for (uint32_t c = 0; c < grid.cols(); ++c) {
            const int px_start_x = static_cast<int>(c) * eff_cell_size;
            if (px_start_x >= img_width) break;
            if (!grid.alive(static_cast<uint16_t>(r), static_cast<uint16_t>(c))) continue;

            int max_dy = std::min(eff_cell_size, img_height - px_start_y);
            int max_dx = std::min(eff_cell_size, img_width - px_start_x);
            for (int dy = inset; dy < max_dy; dy++) {
                for (int dx = inset; dx < max_dx; dx++) {
                    pixels[static_cast<size_t>(px_start_y + dy) * img_width + (px_start_x + dx)] = config.alive_color;
                }
            }
        }
    }

    char frame_str[24];
    snprintf(frame_str, sizeof(frame_str), "%05llu", static_cast<unsigned long long>(frame_number));
    std::string filename = config.output_dir + "/frame_" + frame_str + ".png";

    // Write PNG (RGBA = 4 channels)
    int result = stbi_write_png(filename.c_str(), img_width, img_height, 4,
                                pixels.data(), img_width * 4);

    return result != 0;
}
