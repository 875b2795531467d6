/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration file management for the keychain service
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "keychain_generator.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace keyforge {

/**
 * @brief Raised for unreadable, malformed or inconsistent configuration
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Loads, validates and writes KeychainConfig as JSON
 *
 * Example file:
 * @code
 * {
 *   "fonts_dir": "fonts",
 *   "fonts": { "Pacifico:style=Regular": "Pacifico-Regular.ttf" },
 *   "default_font": "Pacifico:style=Regular",
 *   "openscad_path": "/usr/bin/openscad",
 *   "facet_count": 12,
 *   "render_timeout_seconds": 60,
 *   "port": 5000,
 *   "log_level": "3,RenderOrchestrator=5"
 * }
 * @endcode
 * Keys that are absent keep their defaults; unknown keys are ignored.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;
    explicit ConfigurationManager(const KeychainConfig& config) : config_(config) {}

    /**
     * @brief Merge a configuration file over the current values
     * @throws ConfigurationError if the file cannot be read or parsed, or a
     *         key has the wrong type
     */
    void load_from_file(const std::string& filename);

    /**
     * @brief Merge a parsed JSON object over the current values
     * @throws ConfigurationError as above
     */
    void load_from_json(const nlohmann::json& document);

    /**
     * @brief Write the current values as a JSON file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    nlohmann::json to_json() const;

    /**
     * @brief Check ranges and the font catalog
     * @throws ConfigurationError describing the first problem found
     */
    void validate() const;

    const KeychainConfig& get_config() const { return config_; }
    KeychainConfig& mutable_config() { return config_; }

private:
    KeychainConfig config_;
};

} // namespace keyforge
