/**
 * @file HttpService.hpp
 * @brief HTTP front end for the keychain pipeline
 */

#pragma once

#include "keychain_generator.hpp"
#include "GenerateHandler.hpp"
#include "Logger.hpp"
#include <string>

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace keyforge {

/**
 * @brief Binds the pipeline to POST /generate-stl and GET /health
 *
 * Requests are served on the HTTP library's worker pool; each one runs the
 * whole pipeline on its own, sharing only the read-only generator.
 */
class HttpService {
public:
    explicit HttpService(const KeychainGenerator& generator);

    /**
     * @brief Register routes and CORS handling on a server
     */
    void install(httplib::Server& server) const;

private:
    static void send(const HttpReply& reply, httplib::Response& res);
    static void add_cors_headers(httplib::Response& res);

    GenerateHandler generate_;
    Logger logger_;
};

} // namespace keyforge
