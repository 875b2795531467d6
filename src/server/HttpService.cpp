/**
 * @file HttpService.cpp
 * @brief HTTP front end for the keychain pipeline
 */

#include "HttpService.hpp"
#include <httplib.h>

namespace keyforge {

HttpService::HttpService(const KeychainGenerator& generator)
    : generate_(generator),
      logger_("HttpService") {
}

void HttpService::install(httplib::Server& server) const {
    server.Post("/generate-stl", [this](const httplib::Request& req, httplib::Response& res) {
        logger_.debug("POST /generate-stl from " + req.remote_addr +
                      " (" + std::to_string(req.body.size()) + " bytes)");
        send(generate_.handle(req.body), res);
    });

    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        send(ResponseAssembler::health(), res);
    });

    server.Options(R"(/.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    server.set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
        add_cors_headers(res);
    });
}

void HttpService::send(const HttpReply& reply, httplib::Response& res) {
    res.status = reply.status;
    for (const auto& [name, value] : reply.headers) {
        res.set_header(name, value);
    }
    res.set_content(reply.body, reply.content_type);
}

void HttpService::add_cors_headers(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
    res.set_header("Access-Control-Expose-Headers", "Content-Disposition");
}

} // namespace keyforge
