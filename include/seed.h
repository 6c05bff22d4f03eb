#ifndef GRIDLIFE_SEED_H
#define GRIDLIFE_SEED_H

#include "game_of_life.h"
#include <istream>
#include <optional>
#include <string>
#include <string_view>

enum class SeedFormat {
    Json,     // {"cells": [[row, col], ...]}
    Life106   // "#Life 1.06" header, then "x y" lines (x = column, y = row)
};

/**
 * Pick the seed format from a filename extension.
 * ".json" selects Json; ".life" and ".lif" select Life106.
 * @return std::nullopt for any other extension
 */
[[nodiscard]] std::optional<SeedFormat> seed_format_for(std::string_view filename) noexcept;

/**
 * Parse a seed document.
 * Coordinates are only checked against the 16-bit range here; the grid bounds
 * are enforced when the GameOfLife is constructed.
 * @throws std::runtime_error ("Invalid seed: ...") on malformed input
 */
[[nodiscard]] CellList parse_seed(const std::string& input, SeedFormat format);
[[nodiscard]] CellList parse_seed(std::istream& input, SeedFormat format);

/**
 * Read and parse a seed file, choosing the format by extension.
 * @throws std::invalid_argument on an unsupported extension
 * @throws std::runtime_error if the file cannot be read or is malformed
 */
[[nodiscard]] CellList load_seed_file(const std::string& path);

#endif // GRIDLIFE_SEED_H
