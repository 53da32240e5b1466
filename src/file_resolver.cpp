#include "file_resolver.hpp"
#include "config.hpp"
#include "console.hpp"
#include "verbose.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_set>
#include <regex>

namespace fs = std::filesystem;

namespace fsays {

bool is_text_extension(const std::string& filepath) {
    fs::path p(filepath);
    std::string ext = p.extension().string();
    // Convert to lowercase for case-insensitive comparison.
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return TEXT_EXTENSIONS.count(ext) > 0;
}

bool is_text_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        return false;
    }

    // Read up to 8KB to check for binary content.
    constexpr size_t SAMPLE_SIZE = 8192;
    char buffer[SAMPLE_SIZE];
    file.read(buffer, SAMPLE_SIZE);
    std::streamsize bytes_read = file.gcount();

    for (std::streamsize i = 0; i < bytes_read; ++i) {
        unsigned char c = static_cast<unsigned char>(buffer[i]);
        // Null bytes and most C0 controls indicate binary content. Whitespace
        // controls are fine, the bubble normalizes them.
        if (c == 0) {
            return false;
        }
        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r' && c != '\v' && c != '\f') {
            return false;
        }
    }

    return true;
}

// Returns true if the file can be said: known extension OR text content.
static bool is_sayable_file(const std::string& filepath) {
    if (is_text_extension(filepath)) {
        return true;
    }
    return is_text_file(filepath);
}

// Converts a glob pattern to an equivalent regex pattern.
static std::string glob_to_regex(const std::string& glob) {
    std::string regex;
    regex.reserve(glob.size() * 2);

    size_t i = 0;
    while (i < glob.size()) {
        char c = glob[i];

        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                // ** matches any path components
                if (i + 2 < glob.size() && glob[i + 2] == '/') {
                    regex += "(?:.*/)?";
                    i += 3;
                } else {
                    regex += ".*";
                    i += 2;
                }
            } else {
                // * matches any characters except /
                regex += "[^/]*";
                i++;
            }
        } else if (c == '?') {
            regex += "[^/]";
            i++;
        } else if (c == '[') {
            // Character class, copied through
            regex += '[';
            i++;
            while (i < glob.size() && glob[i] != ']') {
                if (glob[i] == '\\' && i + 1 < glob.size()) {
                    regex += '\\';
                    regex += glob[i + 1];
                    i += 2;
                } else {
                    regex += glob[i];
                    i++;
                }
            }
            if (i < glob.size()) {
                regex += ']';
                i++;
            }
        } else if (c == '.' || c == '(' || c == ')' || c == '{' || c == '}' ||
                   c == '+' || c == '|' || c == '^' || c == '$' || c == '\\') {
            regex += '\\';
            regex += c;
            i++;
        } else {
            regex += c;
            i++;
        }
    }

    return "^" + regex + "$";
}

// Returns true if pattern contains glob wildcard characters.
static bool is_glob_pattern(const std::string& pattern) {
    return pattern.find('*') != std::string::npos ||
           pattern.find('?') != std::string::npos ||
           pattern.find('[') != std::string::npos;
}

// Directory prefix of a glob pattern, up to the first component with a
// wildcard. "." when the pattern starts with one.
static fs::path glob_base_dir(const std::string& pattern) {
    fs::path accumulated;
    for (const auto& component : fs::path(pattern)) {
        if (is_glob_pattern(component.string())) {
            break;
        }
        accumulated /= component;
    }
    if (accumulated.empty()) {
        return ".";
    }
    return accumulated;
}

// Collects all sayable files from a directory recursively, sorted.
static std::vector<fs::path> collect_files_recursive(const fs::path& dir) {
    std::vector<fs::path> files;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(dir)) {
            if (entry.is_regular_file() && is_sayable_file(entry.path().string())) {
                files.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        verbose_err("files", std::string("stopped walking ") + dir.string() + ": " + e.what());
    }
    std::sort(files.begin(), files.end());
    return files;
}

// Expands a glob pattern to the matching regular files, sorted.
static std::vector<fs::path> expand_glob(const std::string& pattern, Console& console) {
    std::vector<fs::path> matches;

    // "./*.txt" and "sub/../*.txt" must match the walk's "a.txt".
    std::string normalized = fs::path(pattern).lexically_normal().generic_string();

    fs::path base_dir = glob_base_dir(normalized);
    if (!fs::is_directory(base_dir)) {
        return matches;
    }

    std::regex re;
    try {
        re = std::regex(glob_to_regex(normalized));
    } catch (const std::regex_error&) {
        console.print_warning("Warning: Invalid pattern: " + pattern);
        return matches;
    }

    try {
        for (const auto& entry : fs::recursive_directory_iterator(base_dir)) {
            if (!entry.is_regular_file()) continue;

            std::string rel_path = entry.path().string();
            // Remove leading "./" when walking the current directory
            if (base_dir == "." && rel_path.compare(0, 2, "./") == 0) {
                rel_path = rel_path.substr(2);
            }

            if (!std::regex_match(rel_path, re)) continue;

            if (!is_sayable_file(entry.path().string())) {
                console.print_warning("Warning: Skipping binary file: " + rel_path);
                continue;
            }
            matches.push_back(entry.path());
        }
    } catch (const fs::filesystem_error& e) {
        verbose_err("files", std::string("stopped walking ") + base_dir.string() + ": " + e.what());
    }

    std::sort(matches.begin(), matches.end());
    return matches;
}

std::vector<std::string> resolve_file_patterns(
    const std::vector<std::string>& patterns,
    Console& console
) {
    std::vector<std::string> files;
    std::unordered_set<std::string> seen;

    auto add = [&](const fs::path& p) {
        std::string abs_path = fs::absolute(p).lexically_normal().string();
        if (seen.insert(abs_path).second) {
            files.push_back(abs_path);
        }
    };

    for (const auto& pattern : patterns) {
        if (is_glob_pattern(pattern)) {
            std::vector<fs::path> matches = expand_glob(pattern, console);
            if (matches.empty()) {
                console.print_warning("Warning: No matches for pattern: " + pattern);
            }
            for (const auto& match : matches) {
                add(match);
            }
            continue;
        }

        // Literal path - could be file or directory
        fs::path p(pattern);

        if (!fs::exists(p)) {
            console.print_warning("Warning: File not found: " + pattern);
            continue;
        }

        if (fs::is_directory(p)) {
            for (const auto& file : collect_files_recursive(p)) {
                add(file);
            }
        } else if (fs::is_regular_file(p)) {
            if (is_sayable_file(pattern)) {
                add(p);
            } else {
                console.print_warning("Warning: Skipping binary file: " + pattern);
            }
        }
    }

    verbose_log("files", "resolved " + std::to_string(files.size()) + " file(s) from " +
                std::to_string(patterns.size()) + " pattern(s)");
    return files;
}

std::string read_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open " + filepath);
    }
    std::string content = read_stream(file);
    if (file.bad()) {
        throw std::runtime_error("Failed to read " + filepath);
    }
    return content;
}

std::string read_stream(std::istream& in) {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace fsays
