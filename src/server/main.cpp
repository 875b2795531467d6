/**
 * @file main.cpp
 * @brief Main entry point for the keyforge-server HTTP service
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "keychain_generator.hpp"
#include "FontCatalog.hpp"
#include "Logger.hpp"
#include "HttpService.hpp"
#include "cli/CommandLineInterface.hpp"
#include <httplib.h>
#include <csignal>
#include <iostream>

using namespace keyforge;

namespace {

httplib::Server* g_server = nullptr;

void handle_shutdown_signal(int) {
    if (g_server) {
        g_server->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLineInterface cli(CommandLineInterface::Tool::Server);
    if (auto exit_code = cli.parse_arguments(argc, argv)) {
        return *exit_code;
    }

    Logger logger("keyforge-server");

    try {
        const KeychainConfig& config = cli.get_config();
        const FontCatalog catalog = FontCatalog::from_config(config);
        const KeychainGenerator generator(config, catalog);

        for (const auto& key : catalog.keys()) {
            logger.detailed("Font " + key + " -> " + catalog.path_of(*catalog.find(key)).string());
        }

        HttpService service(generator);
        httplib::Server server;
        service.install(server);

        g_server = &server;
        std::signal(SIGINT, handle_shutdown_signal);
        std::signal(SIGTERM, handle_shutdown_signal);

        logger.info("Listening on " + config.host + ":" + std::to_string(config.port) +
                    " (fonts: " + catalog.fonts_dir().string() + ")");
        const bool listened = server.listen(config.host, config.port);
        g_server = nullptr;

        if (!listened) {
            logger.error("Could not listen on " + config.host + ":" + std::to_string(config.port));
            return kExitServerError;
        }
        logger.info("Server stopped");
        return kExitSuccess;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitServerError;
    }
}
