/**
 * @file ResponseAssembler.cpp
 * @brief Maps pipeline results onto HTTP replies
 */

#include "ResponseAssembler.hpp"
#include <nlohmann/json.hpp>

namespace keyforge {

using json = nlohmann::json;

HttpReply ResponseAssembler::from_result(const GenerationResult& result) {
    if (!result.outcome.ok()) {
        return from_failure(result.outcome.failure());
    }

    const auto& artifact = result.outcome.artifact();
    HttpReply reply;
    reply.status = 200;
    reply.content_type = kMeshContentType;
    reply.body.assign(artifact.begin(), artifact.end());
    reply.headers["Content-Disposition"] =
        "attachment; filename=\"" + result.suggested_filename() + "\"";
    return reply;
}

HttpReply ResponseAssembler::from_failure(const RenderFailure& failure) {
    json body;
    switch (failure.kind) {
        case FailureKind::InvalidInput:
        case FailureKind::UnknownFont:
            body["error"] = failure.detail;
            break;
        case FailureKind::MissingFontAsset:
            body["error"] = "Font file is missing on the server";
            break;
        case FailureKind::EngineExecutionFailed:
            body["error"] = "OpenSCAD failed";
            body["details"] = failure.detail.empty() ? "Unknown error" : failure.detail;
            break;
        case FailureKind::ArtifactNotProduced:
            body["error"] = "STL file not generated";
            break;
        case FailureKind::EngineTimedOut:
            body["error"] = "OpenSCAD timed out";
            if (!failure.detail.empty()) {
                body["details"] = failure.detail;
            }
            break;
        case FailureKind::UnhandledFault:
            body["error"] = "Internal server error";
            break;
    }
    body["kind"] = failure_kind_name(failure.kind);

    // Engine diagnostics are arbitrary bytes; never let them abort serialization
    return json_reply(status_for(failure.kind), body.dump(-1, ' ', false, json::error_handler_t::replace));
}

HttpReply ResponseAssembler::health() {
    return json_reply(200, json{{"status", "ok"}}.dump());
}

int ResponseAssembler::status_for(FailureKind kind) {
    return is_client_error(kind) ? 400 : 500;
}

HttpReply ResponseAssembler::json_reply(int status, const std::string& body) {
    HttpReply reply;
    reply.status = status;
    reply.content_type = "application/json";
    reply.body = body;
    return reply;
}

} // namespace keyforge
