/**
 * @file CommandLineInterface.cpp
 * @brief Command line handling for the keyforge executables
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "Logger.hpp"
#include "version.h"
#include <cstdlib>
#include <iostream>

namespace keyforge {

namespace {

const char* kGeneratorDescription =
    "Generate a 3D-printable keychain (binary STL) from a short text label\n"
    "\n"
    "The label is sanitized (letters, digits, space, '_' and '-', at most 20\n"
    "characters), extruded on a bordered base plate with a hole tab on the left,\n"
    "and rendered by the OpenSCAD command-line engine.\n"
    "\n"
    "Distances accept a unit suffix: mm (default), cm, in.\n"
    "\n"
    "Examples:\n"
    "  keyforge --name \"Alice\"\n"
    "  keyforge --name \"Bob\" --font \"Lobster:style=Regular\" --text-height 4mm\n"
    "  keyforge --name \"Test\" --dry-run > keychain.scad";

const char* kServerDescription =
    "Serve keychain STL generation over HTTP\n"
    "\n"
    "Endpoints:\n"
    "  POST /generate-stl   JSON {name, font, textHeight, borderThickness, widthOption}\n"
    "  GET  /health         {\"status\": \"ok\"}";

} // namespace

std::optional<int> CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    const bool generator = tool_ == Tool::Generator;
    SimpleCommandLineParser parser(generator ? "keyforge" : "keyforge-server",
                                   generator ? kGeneratorDescription : kServerDescription);
    register_options(parser);

    if (!parser.parse(argc, argv)) {
        return parser.help_requested() ? kExitSuccess : kExitClientError;
    }

    if (parser.get_flag("version")) {
        std::cout << "KeyForge keychain generator v" << KEYFORGE_VERSION_STRING << std::endl;
        return kExitSuccess;
    }

    if (!parser.get_positional().empty()) {
        std::cerr << "Unexpected argument: " << parser.get_positional().front() << std::endl;
        return kExitClientError;
    }

    if (auto config_path = parser.get("create-config")) {
        ConfigurationManager defaults;
        if (!defaults.save_to_file(config_path.value())) {
            std::cerr << "Failed to write configuration file: " << config_path.value() << std::endl;
            return kExitClientError;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return kExitSuccess;
    }

    ConfigurationManager manager;
    if (auto config_file = parser.get("config")) {
        try {
            manager.load_from_file(config_file.value());
        } catch (const ConfigurationError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return kExitClientError;
        }
    }
    config_ = manager.get_config();

    if (!apply_service_options(parser)) {
        return kExitClientError;
    }
    if (generator && !apply_request_options(parser)) {
        return kExitClientError;
    }

    try {
        ConfigurationManager(config_).validate();
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitClientError;
    }

    if (!apply_logging(parser)) {
        return kExitClientError;
    }
    return std::nullopt;
}

void CommandLineInterface::register_options(SimpleCommandLineParser& parser) const {
    if (tool_ == Tool::Generator) {
        parser.add_section("KEYCHAIN");
        parser.add_option("name", "n", "Label text", kDefaultLabel);
        parser.add_option("font", "f", "Font catalog key (see --list-fonts)");
        parser.add_option("text-height", "", "Extrusion height of the letters", "3");
        parser.add_option("border-thickness", "", "Border width and base plate thickness", "2");
        parser.add_option("width-option", "", "Text size", "15");

        parser.add_section("OUTPUT");
        parser.add_option("output", "o", "STL file to write (default: <name>_<font>.stl)");
        parser.add_flag("dry-run", "", "Print the OpenSCAD scene to stdout instead of rendering");
        parser.add_flag("list-fonts", "", "List the font catalog and exit");
    } else {
        parser.add_section("SERVER");
        parser.add_option("host", "", "Address to bind");
        parser.add_option("port", "p", "Port to listen on");
    }

    parser.add_section("CONFIGURATION");
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Write a default configuration file and exit");
    parser.add_option("fonts-dir", "", "Directory holding the font files");
    parser.add_option("openscad", "", "OpenSCAD executable");
    parser.add_option("timeout", "", "Render timeout in seconds (0 = none)");

    parser.add_section("LOGGING");
    parser.add_option("log-level", "", "1=ERROR 2=WARNING 3=INFO 4=DETAILED 5=DEBUG 6=TRACE, "
                      "with per-component overrides, e.g. \"3,RenderOrchestrator=5\"");
    parser.add_option("log-file", "", "Also append log output to this file");
    parser.add_flag("version", "", "Show version information");
}

bool CommandLineInterface::apply_service_options(const SimpleCommandLineParser& parser) {
    if (auto value = parser.get("fonts-dir")) {
        config_.fonts_dir = value.value();
    }
    if (auto value = parser.get("openscad")) {
        config_.openscad_path = value.value();
    }
    if (parser.has("timeout")) {
        auto timeout = parser.get_as<int>("timeout");
        if (!timeout || *timeout < 0) {
            std::cerr << "Error: --timeout must be a non-negative number of seconds" << std::endl;
            return false;
        }
        config_.render_timeout_seconds = *timeout;
    }
    if (auto value = parser.get("host")) {
        config_.host = value.value();
    }
    if (parser.has("port")) {
        auto port = parser.get_as<int>("port");
        if (!port) {
            std::cerr << "Error: --port must be an integer" << std::endl;
            return false;
        }
        config_.port = *port;
    }
    if (auto value = parser.get("log-level")) {
        config_.log_level = value.value();
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();
    }
    return true;
}

bool CommandLineInterface::parse_distance(const SimpleCommandLineParser& parser,
                                          const std::string& option, double& target) const {
    auto value = parser.get(option);
    if (!value) {
        return true;
    }
    try {
        target = unit_parser_.parse_print_distance(value.value()).value;
    } catch (const UnitParseError& e) {
        std::cerr << "Error: --" << option << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool CommandLineInterface::apply_request_options(const SimpleCommandLineParser& parser) {
    request_ = GenerationRequest{};
    if (auto value = parser.get("name")) {
        request_.raw_name = value.value();
    }
    request_.font_key = parser.get("font").value_or(config_.default_font);

    if (!parse_distance(parser, "text-height", request_.text_height) ||
        !parse_distance(parser, "border-thickness", request_.border_thickness) ||
        !parse_distance(parser, "width-option", request_.width_option)) {
        return false;
    }

    output_path_ = parser.get("output");
    dry_run_ = parser.get_flag("dry-run");
    list_fonts_ = parser.get_flag("list-fonts");
    return true;
}

bool CommandLineInterface::apply_logging(const SimpleCommandLineParser& parser) const {
    // Priority: CLI > environment > config file > defaults
    std::string level = config_.log_level;
    std::optional<std::string> log_file = config_.log_file;

    if (!parser.has("log-level")) {
        if (const char* env_level = std::getenv("KEYFORGE_LOG_LEVEL")) {
            level = env_level;
        }
    }
    if (!parser.has("log-file")) {
        if (const char* env_file = std::getenv("KEYFORGE_LOG_FILE")) {
            log_file = std::string(env_file);
        }
    }

    if (!Logger::parseLogConfig(level)) {
        std::cerr << "Error: invalid log level configuration '" << level << "'" << std::endl;
        return false;
    }
    if (!Logger::setLogFile(log_file)) {
        return false;
    }
    return true;
}

} // namespace keyforge
