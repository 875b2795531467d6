/**
 * @file main.cpp
 * @brief Main entry point for the keyforge command-line generator
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "keychain_generator.hpp"
#include "FontCatalog.hpp"
#include "ScadSceneWriter.hpp"
#include "Logger.hpp"
#include "cli/CommandLineInterface.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace keyforge;

namespace {

void print_font_catalog(const FontCatalog& catalog, const std::string& default_font) {
    std::cout << "Fonts in " << catalog.fonts_dir().string() << ":\n";
    for (const auto& key : catalog.keys()) {
        const FontCatalogEntry* entry = catalog.find(key);
        const bool present = std::filesystem::is_regular_file(catalog.path_of(*entry));
        std::cout << "  " << key << " -> " << entry->filename
                  << (present ? "" : " (missing)")
                  << (key == default_font ? " [default]" : "") << "\n";
    }
}

int exit_code_for(FailureKind kind) {
    return is_client_error(kind) ? kExitClientError : kExitServerError;
}

bool write_artifact(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(file);
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLineInterface cli(CommandLineInterface::Tool::Generator);
    if (auto exit_code = cli.parse_arguments(argc, argv)) {
        return *exit_code;
    }

    Logger logger("keyforge");

    try {
        const KeychainConfig& config = cli.get_config();
        const FontCatalog catalog = FontCatalog::from_config(config);

        if (cli.list_fonts_requested()) {
            print_font_catalog(catalog, config.default_font);
            return kExitSuccess;
        }

        KeychainGenerator generator(config, catalog);

        if (cli.is_dry_run()) {
            try {
                const PreparedScene prepared = generator.prepare(cli.get_request());
                std::cout << prepared.scene->source();
                return kExitSuccess;
            } catch (const GenerationError& e) {
                std::cerr << "Error: " << e.what() << std::endl;
                return exit_code_for(e.kind());
            }
        }

        const GenerationResult result = generator.generate(cli.get_request());
        if (!result.outcome.ok()) {
            const RenderFailure& failure = result.outcome.failure();
            std::cerr << "Error [" << failure_kind_name(failure.kind) << "]: "
                      << failure.detail << std::endl;
            return exit_code_for(failure.kind);
        }

        const std::filesystem::path output =
            cli.output_path().value_or(result.suggested_filename());
        if (!write_artifact(output, result.outcome.artifact())) {
            logger.error("Failed to write " + output.string());
            return kExitServerError;
        }

        std::cout << "Wrote " << output.string() << " (" << result.outcome.artifact().size()
                  << " bytes, " << result.elapsed.count() << "ms)" << std::endl;
        return kExitSuccess;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitServerError;
    }
}
