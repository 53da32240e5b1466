#pragma once

/**
 * Verbose logging utility for the fsays CLI.
 *
 * Provides debug output for input gathering, settings loading and bubble
 * rendering when the -v/--verbose flag is enabled.
 */

#include <string>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <sstream>

namespace fsays {

/**
 * Global verbose mode flag.
 */
inline bool g_verbose = false;

/**
 * Set verbose mode.
 */
inline void set_verbose(bool enabled) {
    g_verbose = enabled;
}

/**
 * Get current timestamp as string.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

/**
 * Log a verbose message with timestamp and category.
 */
inline void verbose_log(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    std::cerr << "\033[90m[" << timestamp() << "] \033[36m[" << category << "]\033[0m " << message << std::endl;
}

/**
 * Log error messages (always shown in verbose mode).
 */
inline void verbose_err(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    std::cerr << "\033[90m[" << timestamp() << "] \033[31m[" << category << " ERR]\033[0m " << message << std::endl;
}

/**
 * Truncate long content for display.
 */
inline std::string truncate(const std::string& s, size_t max_len = 60) {
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len) + "... (" + std::to_string(s.length()) + " bytes total)";
}

} // namespace fsays
