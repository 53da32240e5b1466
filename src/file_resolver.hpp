#pragma once

/**
 * Message sources for the fsays CLI.
 *
 * Resolves --files patterns (globs, directories, literal paths) to the list
 * of text files to say, and reads whole files or streams into memory.
 */

#include <istream>
#include <string>
#include <vector>

namespace fsays {

class Console;

// Returns true if the file has an extension always treated as text.
bool is_text_extension(const std::string& filepath);

// Returns true if the file appears to be a text file by examining its content.
// Checks for null bytes and control characters that indicate binary content.
bool is_text_file(const std::string& filepath);

/**
 * Resolves glob patterns to a list of file paths, in pattern order.
 *
 * Supports:
 *   - Literal file paths (e.g., "notes.txt")
 *   - Single * and ? wildcards (match within a path component)
 *   - ** recursive wildcard (matches any directory depth)
 *   - Directory paths (walks all text files recursively, sorted)
 *
 * Warnings are printed to console for missing files, binary files and
 * patterns without matches. Duplicate paths are dropped.
 */
std::vector<std::string> resolve_file_patterns(
    const std::vector<std::string>& patterns,
    Console& console
);

// Reads a whole file. Throws std::runtime_error if it cannot be read.
std::string read_file(const std::string& filepath);

// Reads a stream until end of input.
std::string read_stream(std::istream& in);

} // namespace fsays
