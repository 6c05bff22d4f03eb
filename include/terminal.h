#ifndef GRIDLIFE_TERMINAL_H
#define GRIDLIFE_TERMINAL_H

#include <cstdint>
#include <optional>

struct TerminalSize {
    uint16_t rows;
    uint16_t cols;
};

/**
 * Query the size of the terminal attached to stdout.
 * @return std::nullopt if stdout is not a terminal or reports a zero size
 */
[[nodiscard]] std::optional<TerminalSize> query_terminal_size() noexcept;

#endif // GRIDLIFE_TERMINAL_H
