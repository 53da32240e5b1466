#include "console.hpp"
#include <cstdlib>

namespace fsays {

Console::Console(std::ostream& err) : err_(err), colors_enabled_(true) {
    enable_colors();
}

void Console::enable_colors() {
    // Check if output is a terminal
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb") {
        colors_enabled_ = false;
    }
}

void Console::print_error(const std::string& text) const {
    if (colors_enabled_) {
        err_ << ansi::RED << text << ansi::RESET << std::endl;
    } else {
        err_ << text << std::endl;
    }
}

void Console::print_warning(const std::string& text) const {
    if (colors_enabled_) {
        err_ << ansi::YELLOW << text << ansi::RESET << std::endl;
    } else {
        err_ << text << std::endl;
    }
}

} // namespace fsays
