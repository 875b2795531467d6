// ConfigurationManagerTest.cpp
//
// Loading, validating and writing the JSON service configuration.

#include "ConfigurationManager.hpp"
#include "TestSupport.hpp"

using namespace keyforge;
using keyforge::test::require;
using json = nlohmann::json;

namespace {

template <typename Fn>
bool throws_config_error(Fn&& fn) {
    try {
        fn();
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

void test_defaults() {
    test::section("defaults");
    const ConfigurationManager manager;
    const KeychainConfig& config = manager.get_config();
    require(config.fonts.size() == 2, "two built-in fonts");
    require(config.fonts.at("Lobster:style=Regular") == "Lobster-Regular.ttf", "Lobster file name");
    require(config.default_font == "Pacifico:style=Regular", "Pacifico is the default font");
    require(config.openscad_path == "openscad", "engine looked up in PATH");
    require(config.facet_count == 12, "$fn 12");
    require(config.render_timeout_seconds == 0, "no render timeout");
    require(config.port == 5000, "port 5000");
    require(config.log_level == "3", "INFO logging");
    require(!config.log_file.has_value(), "no log file");
    require(!throws_config_error([&] { manager.validate(); }), "defaults validate");
}

void test_loading() {
    test::section("loading");
    ConfigurationManager manager;
    manager.load_from_json(json::parse(R"({
        "fonts_dir": "/srv/fonts",
        "fonts": {"Titan One:style=Regular": "TitanOne-Regular.ttf"},
        "default_font": "Titan One:style=Regular",
        "openscad_path": "/usr/local/bin/openscad",
        "facet_count": 24,
        "render_timeout_seconds": 90,
        "port": 8080,
        "log_level": 5,
        "log_file": "/var/log/keyforge.log",
        "unknown_key": [1, 2, 3]
    })"));
    const KeychainConfig& config = manager.get_config();
    require(config.fonts_dir == "/srv/fonts", "fonts_dir");
    require(config.fonts.size() == 1 && config.fonts.count("Titan One:style=Regular") == 1,
            "fonts replace the built-in catalog");
    require(config.openscad_path == "/usr/local/bin/openscad", "openscad_path");
    require(config.facet_count == 24, "facet_count");
    require(config.render_timeout_seconds == 90, "render_timeout_seconds");
    require(config.port == 8080, "port");
    require(config.log_level == "5", "numeric log level stored as logger syntax");
    require(config.log_file == std::optional<std::string>("/var/log/keyforge.log"), "log_file");
    require(config.host == "0.0.0.0", "absent keys keep their defaults");
    require(!throws_config_error([&] { manager.validate(); }), "loaded configuration validates");

    manager.load_from_json(json::parse(R"({"log_file": null, "log_level": "3,RenderOrchestrator=6"})"));
    require(!manager.get_config().log_file.has_value(), "null log_file clears it");
    require(manager.get_config().log_level == "3,RenderOrchestrator=6", "string log level kept verbatim");
}

void test_type_errors() {
    test::section("type errors");
    ConfigurationManager manager;
    require(throws_config_error([&] { manager.load_from_json(json::parse(R"({"port": "eighty"})")); }),
            "string port");
    require(throws_config_error([&] { manager.load_from_json(json::parse(R"({"port": 5000.7})")); }),
            "fractional port");
    require(throws_config_error([&] { manager.load_from_json(json::parse(R"({"facet_count": 12.5})")); }),
            "fractional facet count");
    require(throws_config_error([&] { manager.load_from_json(json::parse(R"({"render_timeout_seconds": 1e1})")); }),
            "floating-point timeout");
    require(throws_config_error([&] { manager.load_from_json(json::parse(R"({"port": true})")); }),
            "boolean port");
    require(throws_config_error([&] { manager.load_from_json(json::parse(R"({"fonts": ["a.ttf"]})")); }),
            "fonts as array");
    require(throws_config_error([&] { manager.load_from_json(json::parse(R"({"fonts": {"A": 1}})")); }),
            "font file as number");
    require(throws_config_error([&] { manager.load_from_json(json::parse(R"({"log_level": true})")); }),
            "boolean log level");
    require(throws_config_error([&] { manager.load_from_json(json::parse("[]")); }), "non-object document");
}

void test_validation() {
    test::section("validation");
    auto invalid = [](auto mutate) {
        ConfigurationManager manager;
        mutate(manager.mutable_config());
        return throws_config_error([&] { manager.validate(); });
    };
    require(invalid([](KeychainConfig& c) { c.fonts.clear(); }), "empty catalog");
    require(invalid([](KeychainConfig& c) { c.openscad_path.clear(); }), "empty engine path");
    require(invalid([](KeychainConfig& c) { c.facet_count = 2; }), "facet count below 3");
    require(invalid([](KeychainConfig& c) { c.render_timeout_seconds = -1; }), "negative timeout");
    require(invalid([](KeychainConfig& c) { c.port = 70000; }), "port out of range");
    require(invalid([](KeychainConfig& c) { c.default_font = "Unknown"; }), "default font outside the catalog");
    require(invalid([](KeychainConfig& c) { c.fonts["Evil"] = "../../etc/passwd"; }), "font file escaping the directory");
}

void test_files(const std::filesystem::path& dir) {
    test::section("files");
    ConfigurationManager original;
    original.mutable_config().port = 6001;
    original.mutable_config().log_file = "service.log";
    const auto path = dir / "keyforge.json";
    require(original.save_to_file(path.string()), "configuration written");

    ConfigurationManager reloaded;
    reloaded.load_from_file(path.string());
    require(reloaded.get_config().port == 6001, "written values load back");
    require(reloaded.get_config().log_file == std::optional<std::string>("service.log"), "log file loads back");
    require(reloaded.to_json() == original.to_json(), "every key survives the file");

    test::write_file(dir / "broken.json", "{ \"port\": ");
    require(throws_config_error([&] { ConfigurationManager().load_from_file((dir / "broken.json").string()); }),
            "malformed file");
    require(throws_config_error([&] { ConfigurationManager().load_from_file((dir / "absent.json").string()); }),
            "missing file");
    require(!original.save_to_file((dir / "no-such-dir" / "x.json").string()), "unwritable path reported");
}

} // namespace

int main() {
    ScopedWorkspace scratch("", "keyforge-config-test-");
    test_defaults();
    test_loading();
    test_type_errors();
    test_validation();
    test_files(scratch.path());
    return test::summary("ConfigurationManagerTest");
}
