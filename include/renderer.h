#ifndef GRIDLIFE_RENDERER_H
#define GRIDLIFE_RENDERER_H

#include "game_of_life.h"
#include <cstdint>
#include <ostream>
#include <string>

// UTF-8 glyphs, one per cell
constexpr char kAliveGlyph[] = "\xE2\x96\x88";  // U+2588 FULL BLOCK
constexpr char kDeadGlyph[] = "\xE2\x96\x91";   // U+2591 LIGHT SHADE

/**
 * Write one text frame: a glyph per cell, row by row, with a line break
 * between rows and none after the last row.
 */
void write_frame(const Grid& grid, std::ostream& out);

/** Same as write_frame(), returned as a string. */
std::string format_frame(const Grid& grid);

/** Write cells as "(r, c)" separated by spaces, in list order. */
void write_cells(const CellList& cells, std::ostream& out);

/**
 * Configuration for rendering grid frames to PNG images.
 */
struct RenderConfig {
    std::string output_dir = ".";   // Directory to save PNG files
    int cell_size = 4;              // Pixels per cell
    int max_width = 4096;           // Maximum image width
    int max_height = 4096;          // Maximum image height
    uint32_t alive_color = 0xFF00FF00;  // RGBA: green
    uint32_t dead_color = 0xFF000000;   // RGBA: black
    uint32_t grid_color = 0xFF333333;   // RGBA: dark gray (optional grid lines)
    bool show_grid = false;         // Draw grid lines
    int64_t max_pixels = 16 * 1024 * 1024;  // Maximum total pixels (16 megapixels)
};

/**
 * Render the whole grid to <output_dir>/frame_NNNNN.png (at least five digits).
 * The cell size shrinks (down to 1 pixel) to stay within max_pixels.
 *
 * @param grid Current grid state
 * @param config Rendering configuration
 * @param frame_number Frame number (used for filename)
 * @return true if successful, false on error
 */
[[nodiscard]] bool render_png(const Grid& grid, const RenderConfig& config, uint64_t frame_number);

#endif // GRIDLIFE_RENDERER_H
