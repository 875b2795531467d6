// ResponseAssemblerTest.cpp
//
// Mapping of pipeline results to HTTP status, headers and bodies.

#include "ResponseAssembler.hpp"
#include "TestSupport.hpp"
#include <nlohmann/json.hpp>

using namespace keyforge;
using keyforge::test::require;
using json = nlohmann::json;

namespace {

json body_of(const HttpReply& reply) {
    return json::parse(reply.body);
}

void test_success() {
    test::section("success");
    GenerationResult result;
    result.sanitized_name = "Alice";
    result.font_key = "Lobster:style=Regular";
    result.outcome = RenderOutcome::success({'s', 'o', 'l', 'i', 'd', 0, 1, 2});

    const HttpReply reply = ResponseAssembler::from_result(result);
    require(reply.status == 200, "status 200");
    require(reply.content_type == "application/sla", "mesh MIME type");
    require(reply.body.size() == 8 && reply.body[5] == '\0', "binary body preserved byte for byte");
    require(reply.headers.count("Content-Disposition") == 1 &&
            reply.headers.at("Content-Disposition") == "attachment; filename=\"Alice_Lobster.stl\"",
            "attachment named <name>_<font>.stl");
}

void test_client_errors() {
    test::section("client errors");
    const HttpReply invalid = ResponseAssembler::from_failure(
        {FailureKind::InvalidInput, "textHeight must be a positive number, got -1"});
    require(invalid.status == 400, "InvalidInput is 400");
    require(invalid.content_type == "application/json", "JSON error body");
    require(body_of(invalid)["error"] == "textHeight must be a positive number, got -1", "message passed through");
    require(body_of(invalid)["kind"] == "InvalidInput", "kind name included");

    const HttpReply font = ResponseAssembler::from_failure(
        {FailureKind::UnknownFont, "Font \"Comic\" is not available"});
    require(font.status == 400, "UnknownFont is 400");
    require(body_of(font)["error"] == "Font \"Comic\" is not available", "UnknownFont message");
    require(!body_of(font).contains("details"), "no details for client errors");
}

void test_server_errors() {
    test::section("server errors");
    const HttpReply engine = ResponseAssembler::from_failure(
        {FailureKind::EngineExecutionFailed, "ERROR: Parser error"});
    require(engine.status == 500, "EngineExecutionFailed is 500");
    require(body_of(engine)["error"] == "OpenSCAD failed", "fixed error text");
    require(body_of(engine)["details"] == "ERROR: Parser error", "diagnostics in details");

    const HttpReply silent = ResponseAssembler::from_failure({FailureKind::EngineExecutionFailed, ""});
    require(body_of(silent)["details"] == "Unknown error", "empty diagnostics become Unknown error");

    const HttpReply garbage = ResponseAssembler::from_failure(
        {FailureKind::EngineExecutionFailed, std::string("bad \xff\xfe bytes")});
    require(garbage.status == 500 && json::accept(garbage.body), "invalid UTF-8 diagnostics still give valid JSON");

    const HttpReply artifact = ResponseAssembler::from_failure(
        {FailureKind::ArtifactNotProduced, "STL file not generated"});
    require(artifact.status == 500 && body_of(artifact)["error"] == "STL file not generated",
            "ArtifactNotProduced");

    const HttpReply asset = ResponseAssembler::from_failure(
        {FailureKind::MissingFontAsset, "Font file \"Lobster-Regular.ttf\" not found in fonts directory"});
    require(asset.status == 500, "MissingFontAsset is 500");
    require(asset.body.find("Lobster-Regular.ttf") == std::string::npos, "MissingFontAsset is opaque");

    const HttpReply fault = ResponseAssembler::from_failure(
        {FailureKind::UnhandledFault, "/var/tmp/keyforge-abc: Permission denied"});
    require(fault.status == 500, "UnhandledFault is 500");
    require(fault.body.find("/var/tmp") == std::string::npos, "UnhandledFault is opaque");

    const HttpReply timeout = ResponseAssembler::from_failure(
        {FailureKind::EngineTimedOut, "Rendering exceeded 60 seconds"});
    require(timeout.status == 500 && body_of(timeout)["kind"] == "EngineTimedOut", "EngineTimedOut is 500");
}

void test_health() {
    test::section("health");
    const HttpReply health = ResponseAssembler::health();
    require(health.status == 200, "status 200");
    require(body_of(health) == json{{"status", "ok"}}, "{\"status\": \"ok\"}");
}

} // namespace

int main() {
    test_success();
    test_client_errors();
    test_server_errors();
    test_health();
    return test::summary("ResponseAssemblerTest");
}
