/**
 * @file CommandLineInterface.hpp
 * @brief Command line handling for the keyforge and keyforge-server executables
 */

#pragma once

#include "keychain_generator.hpp"
#include "SimpleCommandLineParser.hpp"
#include "UnitParser.hpp"
#include <optional>
#include <string>

namespace keyforge {

/// Process exit codes shared by both executables
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitClientError = 1;
inline constexpr int kExitServerError = 2;

/**
 * @brief Parses arguments, merges them over the configuration file and
 *        applies the logging setup
 *
 * Precedence: defaults < --config file < KEYFORGE_LOG_LEVEL/KEYFORGE_LOG_FILE
 * environment < command-line options.
 */
class CommandLineInterface {
public:
    enum class Tool {
        Generator,   ///< keyforge: one keychain, written to a file
        Server       ///< keyforge-server: HTTP service
    };

    explicit CommandLineInterface(Tool tool) : tool_(tool) {}

    /**
     * @brief Parse command line arguments
     * @return std::nullopt to continue running, otherwise the exit code to
     *         return immediately (help shown, config created, bad arguments)
     */
    std::optional<int> parse_arguments(int argc, char* argv[]);

    const KeychainConfig& get_config() const { return config_; }
    const GenerationRequest& get_request() const { return request_; }

    bool is_dry_run() const { return dry_run_; }
    bool list_fonts_requested() const { return list_fonts_; }

    /// Explicit --output path, if any
    const std::optional<std::string>& output_path() const { return output_path_; }

private:
    void register_options(SimpleCommandLineParser& parser) const;
    bool apply_service_options(const SimpleCommandLineParser& parser);
    bool apply_request_options(const SimpleCommandLineParser& parser);
    bool apply_logging(const SimpleCommandLineParser& parser) const;
    bool parse_distance(const SimpleCommandLineParser& parser, const std::string& option,
                        double& target) const;

    Tool tool_;
    KeychainConfig config_;
    GenerationRequest request_;
    UnitParser unit_parser_;
    bool dry_run_ = false;
    bool list_fonts_ = false;
    std::optional<std::string> output_path_;
};

} // namespace keyforge
