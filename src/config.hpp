#pragma once

/**
 * Application configuration constants.
 *
 * Defines the settings file location, default bubble width, and file types
 * accepted by the fsays CLI.
 */

#include <cstddef>
#include <string>
#include <unordered_set>

namespace fsays {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".fsays.json";  // Local settings file.

// ========== Bubble Layout ==========

constexpr std::size_t DEFAULT_WIDTH = 40;  // Maximum bubble width when none is given.
constexpr std::size_t MAX_WIDTH = 1000;    // Largest width accepted from -w or settings.

// ========== Supported File Extensions ==========

// Extensions always treated as text when passed with --files. Anything else is
// sniffed for binary content first.
inline const std::unordered_set<std::string> TEXT_EXTENSIONS = {
    ".txt", ".md", ".rst", ".org", ".adoc", ".tex",
    ".json", ".xml", ".csv", ".tsv", ".yaml", ".yml", ".toml", ".ini", ".cfg", ".conf",
    ".c", ".cc", ".cpp", ".h", ".hpp", ".rs", ".py", ".go", ".java", ".js", ".ts",
    ".sh", ".bash", ".zsh", ".lua", ".rb", ".pl", ".hs", ".sql"
};

} // namespace fsays
