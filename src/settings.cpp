#include "settings.hpp"
#include "verbose.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fsays {

using json = nlohmann::json;

std::optional<Settings> load_settings(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            verbose_err("settings", "cannot check " + path + ": " + ec.message());
        } else {
            verbose_log("settings", "no settings file at " + path);
        }
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        verbose_err("settings", "cannot open " + path);
        return std::nullopt;
    }

    try {
        json j;
        file >> j;

        Settings settings;
        if (j.contains("width")) {
            if (j["width"].is_number_unsigned() && j["width"].get<std::size_t>() <= MAX_WIDTH) {
                settings.width = j["width"].get<std::size_t>();
            } else {
                verbose_err("settings", "ignoring width, expected an integer from 0 to " +
                            std::to_string(MAX_WIDTH));
            }
        }
        settings.use_stderr = j.value("stderr", false);

        verbose_log("settings", "loaded " + path + ": width=" + std::to_string(settings.width) +
                    (settings.use_stderr ? ", stderr" : ""));
        return settings;
    } catch (const json::exception& e) {
        verbose_err("settings", "malformed " + path + ": " + e.what());
        return std::nullopt;
    }
}

void save_settings(const Settings& settings, const std::string& path) {
    json j;
    j["width"] = settings.width;
    j["stderr"] = settings.use_stderr;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open " + path + " for writing");
    }
    file << j.dump(2) << std::endl;
    if (!file) {
        throw std::runtime_error("Failed to write " + path);
    }
    verbose_log("settings", "saved " + path);
}

} // namespace fsays
