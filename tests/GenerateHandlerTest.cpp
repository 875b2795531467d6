// GenerateHandlerTest.cpp
//
// Request body to HTTP reply through the real pipeline, with a /bin/sh
// script standing in for the render engine.

#include "GenerateHandler.hpp"
#include "FontCatalog.hpp"
#include "TestSupport.hpp"
#include <nlohmann/json.hpp>

using namespace keyforge;
using keyforge::test::require;
using json = nlohmann::json;

namespace {

struct Fixture {
    ScopedWorkspace root{"", "keyforge-handler-test-"};
    std::filesystem::path fonts = root.path() / "fonts";
    KeychainConfig config;

    Fixture() {
        std::filesystem::create_directories(fonts);
        test::write_file(fonts / "Pacifico-Regular.ttf", "fake font");
        config.fonts_dir = fonts.string();
        config.work_dir = root.path().string();
        config.openscad_path = test::write_engine(root.path(), "engine.sh", "cp \"$3\" \"$2\"").string();
    }
};

std::string kind_of(const HttpReply& reply) {
    return json::parse(reply.body).value("kind", "");
}

void test_rejections(const GenerateHandler& handler) {
    test::section("rejections");
    const HttpReply malformed = handler.handle("{ not json");
    require(malformed.status == 400, "malformed JSON is 400");
    require(kind_of(malformed) == "InvalidInput", "malformed JSON is InvalidInput");

    const HttpReply array = handler.handle("[]");
    require(array.status == 400 && kind_of(array) == "InvalidInput", "non-object body is InvalidInput");

    const HttpReply font = handler.handle(R"({"font": 7})");
    require(font.status == 400, "non-string font is 400");
    require(kind_of(font) == "UnknownFont", "non-string font is UnknownFont");

    const HttpReply unknown = handler.handle(R"({"font": "Comic Sans:style=Regular"})");
    require(unknown.status == 400 && kind_of(unknown) == "UnknownFont", "uncatalogued font is UnknownFont");

    const HttpReply negative = handler.handle(R"({"textHeight": -3})");
    require(negative.status == 400 && kind_of(negative) == "InvalidInput", "negative height is InvalidInput");

    const HttpReply bad_unit = handler.handle(R"({"widthOption": "15 parsecs"})");
    require(bad_unit.status == 400 && kind_of(bad_unit) == "InvalidInput", "unknown unit is InvalidInput");

    const HttpReply missing_asset = handler.handle(R"({"font": "Lobster:style=Regular"})");
    require(missing_asset.status == 500 && kind_of(missing_asset) == "MissingFontAsset",
            "catalogued font without a file is a server fault");
}

void test_success(const GenerateHandler& handler) {
    test::section("success");
    const HttpReply reply = handler.handle(R"({"name": "Hi!", "widthOption": "1.5cm"})");
    require(reply.status == 200, "valid request is 200");
    require(reply.content_type == "application/sla", "mesh MIME type");
    require(reply.headers.count("Content-Disposition") == 1 &&
            reply.headers.at("Content-Disposition") == "attachment; filename=\"Hi_Pacifico.stl\"",
            "attachment named from the sanitized name");
    require(reply.body.find("text(\"Hi\", size=15") != std::string::npos, "unit-suffixed width reaches the scene");
}

} // namespace

int main() {
    Fixture fx;
    const FontCatalog catalog = FontCatalog::from_config(fx.config);
    const KeychainGenerator generator(fx.config, catalog);
    const GenerateHandler handler(generator);

    test_rejections(handler);
    test_success(handler);
    return test::summary("GenerateHandlerTest");
}
