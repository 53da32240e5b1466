#include "config.hpp"
#include "console.hpp"
#include "file_resolver.hpp"
#include "settings.hpp"
#include "speech_bubble.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <ios>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fsays;

// Joins command-line words into one message, as a shell would have printed them.
static std::string join_words(const std::vector<std::string>& words) {
    std::string message;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) message += ' ';
        message += words[i];
    }
    return message;
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Print a message in a speech bubble above an ASCII mascot"};
    app.footer("\nExamples:\n"
               "  fsays Hello fellow Rustaceans!     Say the arguments\n"
               "  fsays -w 20 < notes.txt            Say stdin, wrapped at 20 columns\n"
               "  fsays -f 'docs/*.txt'              One bubble per matching file\n"
               "  fsays -w 60 --save                 Remember width 60 in .fsays.json\n");

    std::vector<std::string> words;
    app.add_option("text", words, "Message to say; read from stdin when neither text nor files are given");

    size_t width = DEFAULT_WIDTH;
    auto* width_opt = app.add_option("-w,--width", width,
                                     "Maximum bubble width in columns (default: settings file, else 40)")
        ->check(CLI::Range(static_cast<size_t>(0), MAX_WIDTH));

    std::vector<std::string> file_patterns;
    app.add_option("-f,--files", file_patterns,
                   "Files, directories or glob patterns; each file gets its own bubble");

    bool use_stderr = false;
    app.add_flag("--stderr", use_stderr, "Write to stderr instead of stdout");

    std::string config_path = SETTINGS_FILE;
    app.add_option("-c,--config", config_path, "Settings file (default: .fsays.json)");

    bool save = false;
    app.add_flag("--save", save, "Store the effective width and output stream in the settings file");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log diagnostics to stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);
    Console console;

    try {
        // Command-line options override the settings file.
        Settings settings = load_settings(config_path).value_or(Settings{});
        if (*width_opt) {
            settings.width = width;
        }
        if (use_stderr) {
            settings.use_stderr = true;
        }
        verbose_log("main", "width=" + std::to_string(settings.width) +
                    ", output=" + (settings.use_stderr ? "stderr" : "stdout"));

        if (save) {
            save_settings(settings, config_path);
        }

        std::vector<std::string> messages;
        if (!words.empty()) {
            messages.push_back(join_words(words));
        }

        if (!file_patterns.empty()) {
            std::vector<std::string> files = resolve_file_patterns(file_patterns, console);
            if (files.empty() && messages.empty()) {
                console.print_error("Error: No readable files to say");
                return 1;
            }
            for (const auto& file : files) {
                verbose_log("main", "reading " + file);
                messages.push_back(read_file(file));
            }
        }

        if (messages.empty()) {
            if (save) {
                // Only asked to store settings.
                return 0;
            }
            std::string input = read_stream(std::cin);
            if (std::cin.bad()) {
                throw std::runtime_error("Failed to read stdin");
            }
            verbose_log("main", "stdin: " + truncate(input));
            messages.push_back(input);
        }

        std::ostream& out = settings.use_stderr ? std::cerr : std::cout;
        for (size_t i = 0; i < messages.size(); ++i) {
            if (i > 0) out << '\n';
            say(messages[i], settings.width, out);
        }
        out.flush();
        if (!out) {
            throw std::ios_base::failure("failed to flush output");
        }
    } catch (const std::exception& e) {
        console.print_error("Error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
