#pragma once

/**
 * Settings for the fsays CLI.
 *
 * Loaded from a local JSON file so a preferred bubble width and output
 * stream don't have to be passed on every invocation. Command-line options
 * override whatever the file says.
 */

#include "config.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace fsays {

/**
 * Application settings stored in .fsays.json.
 *
 * Example:
 *   { "width": 60, "stderr": false }
 */
struct Settings {
    std::size_t width = DEFAULT_WIDTH;  // Maximum bubble width in columns.
    bool use_stderr = false;            // Write bubbles to stderr instead of stdout.
};

// Loads settings from path. Returns empty optional if the file doesn't exist
// or isn't valid JSON.
std::optional<Settings> load_settings(const std::string& path = SETTINGS_FILE);

// Saves settings to path.
void save_settings(const Settings& settings, const std::string& path = SETTINGS_FILE);

} // namespace fsays
