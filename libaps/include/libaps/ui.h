#pragma once

#include <unistd.h> // For isatty and STDIN_FILENO

namespace aps::ui {

    /**
     * @brief Checks if standard input is connected to an interactive terminal (TTY).
     * @return True if a user can answer prompts, false otherwise (e.g., piped input or CI).
     */
    inline bool is_interactive() {
        // isatty() returns 1 if the file descriptor is a terminal, 0 otherwise.
        return isatty(STDIN_FILENO) != 0;
    }

    /**
     * @brief Checks if standard output is a terminal, used to decide on colored output.
     */
    inline bool stdout_is_terminal() {
        return isatty(STDOUT_FILENO) != 0;
    }

} // namespace aps::ui
