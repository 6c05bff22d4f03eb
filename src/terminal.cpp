#include "terminal.h"

#include <sys/ioctl.h>
#include <unistd.h>

std::optional<TerminalSize> query_terminal_size() noexcept {
    struct winsize ws {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0) {
        return std::nullopt;
    }
    if (ws.ws_row == 0 || ws.ws_col == 0) {
        return std::nullopt;
    }
    return TerminalSize{ws.ws_row, ws.ws_col};
}
