/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for the keychain service
 */

#include "ConfigurationManager.hpp"
#include "FontCatalog.hpp"
#include <fstream>
#include <type_traits>

namespace keyforge {

using json = nlohmann::json;

namespace {

template <typename T>
void read_value(const json& document, const char* key, T& target) {
    if (!document.contains(key) || document[key].is_null()) return;
    // get<int>() would silently truncate 12.5
    if constexpr (std::is_integral_v<T>) {
        if (!document[key].is_number_integer()) {
            throw ConfigurationError(std::string("Invalid value for '") + key +
                                     "': expected an integer, got " + document[key].dump());
        }
    }
    try {
        target = document[key].get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

void ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigurationError("Could not open config file: " + filename);
    }

    json document;
    try {
        file >> document;
    } catch (const json::exception& e) {
        throw ConfigurationError("Error parsing JSON config file " + filename + ": " + e.what());
    }
    load_from_json(document);
}

void ConfigurationManager::load_from_json(const json& document) {
    if (!document.is_object()) {
        throw ConfigurationError("Configuration must be a JSON object");
    }

    read_value(document, "fonts_dir", config_.fonts_dir);
    read_value(document, "default_font", config_.default_font);
    read_value(document, "openscad_path", config_.openscad_path);
    read_value(document, "work_dir", config_.work_dir);
    read_value(document, "facet_count", config_.facet_count);
    read_value(document, "render_timeout_seconds", config_.render_timeout_seconds);
    read_value(document, "host", config_.host);
    read_value(document, "port", config_.port);

    // Fonts replace the built-in catalog rather than extending it
    if (document.contains("fonts") && !document["fonts"].is_null()) {
        const json& fonts = document["fonts"];
        if (!fonts.is_object()) {
            throw ConfigurationError("'fonts' must map font keys to file names");
        }
        std::map<std::string, std::string> catalog;
        for (const auto& [key, value] : fonts.items()) {
            if (!value.is_string()) {
                throw ConfigurationError("Font '" + key + "' must map to a file name string");
            }
            catalog[key] = value.get<std::string>();
        }
        config_.fonts = std::move(catalog);
    }

    // Log level is accepted as a number or a logger configuration string
    if (document.contains("log_level") && !document["log_level"].is_null()) {
        const json& level = document["log_level"];
        if (level.is_number_integer()) {
            config_.log_level = std::to_string(level.get<int>());
        } else if (level.is_string()) {
            config_.log_level = level.get<std::string>();
        } else {
            throw ConfigurationError("'log_level' must be a number or a string");
        }
    }

    if (document.contains("log_file")) {
        if (document["log_file"].is_null()) {
            config_.log_file.reset();
        } else if (document["log_file"].is_string()) {
            config_.log_file = document["log_file"].get<std::string>();
        } else {
            throw ConfigurationError("'log_file' must be a string");
        }
    }
}

json ConfigurationManager::to_json() const {
    json document;
    document["fonts_dir"] = config_.fonts_dir;
    document["fonts"] = config_.fonts;
    document["default_font"] = config_.default_font;
    document["openscad_path"] = config_.openscad_path;
    document["work_dir"] = config_.work_dir;
    document["facet_count"] = config_.facet_count;
    document["render_timeout_seconds"] = config_.render_timeout_seconds;
    document["host"] = config_.host;
    document["port"] = config_.port;
    document["log_level"] = config_.log_level;
    document["log_file"] = config_.log_file ? json(*config_.log_file) : json(nullptr);
    return document;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << to_json().dump(2) << std::endl;
    return static_cast<bool>(file);
}

void ConfigurationManager::validate() const {
    if (config_.fonts.empty()) {
        throw ConfigurationError("Font catalog is empty");
    }
    if (config_.openscad_path.empty()) {
        throw ConfigurationError("'openscad_path' must not be empty");
    }
    if (config_.facet_count < 3) {
        throw ConfigurationError("'facet_count' must be at least 3, got " +
                                 std::to_string(config_.facet_count));
    }
    if (config_.render_timeout_seconds < 0) {
        throw ConfigurationError("'render_timeout_seconds' must not be negative");
    }
    if (config_.port < 1 || config_.port > 65535) {
        throw ConfigurationError("'port' must be between 1 and 65535, got " +
                                 std::to_string(config_.port));
    }

    try {
        FontCatalog::from_config(config_);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(e.what());
    }
}

} // namespace keyforge
