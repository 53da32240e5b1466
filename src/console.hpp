#pragma once

#include <string>
#include <iostream>

namespace fsays {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors. Used for diagnostics only, never
// inside a bubble.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* YELLOW = "\033[33m";
}

/**
 * Diagnostic output helper with color support.
 *
 * Messages go to stderr so they never mix with bubbles written to stdout.
 * Falls back to plain text when colors are not supported (TERM unset or
 * TERM=dumb).
 */
class Console {
public:
    // Creates a Console writing to err and detects color support.
    explicit Console(std::ostream& err = std::cerr);

    // Prints error message in red.
    void print_error(const std::string& text) const;

    // Prints warning message in yellow.
    void print_warning(const std::string& text) const;

private:
    std::ostream& err_;
    bool colors_enabled_;  // True if terminal supports ANSI colors.

    // Detects and enables color support based on terminal capabilities.
    void enable_colors();
};

} // namespace fsays
