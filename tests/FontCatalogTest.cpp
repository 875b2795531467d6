// FontCatalogTest.cpp
//
// Closed font catalog: key lookup, missing assets, and catalog validation.

#include "FontCatalog.hpp"
#include "TestSupport.hpp"
#include <optional>
#include <stdexcept>

using namespace keyforge;
using keyforge::test::require;

namespace {

template <typename Fn>
std::optional<FailureKind> resolve_failure(Fn&& fn) {
    try {
        fn();
    } catch (const GenerationError& e) {
        return e.kind();
    }
    return std::nullopt;
}

template <typename Fn>
bool throws_invalid_argument(Fn&& fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void test_resolution(const std::filesystem::path& fonts_dir) {
    test::section("resolution");
    test::write_file(fonts_dir / "Pacifico-Regular.ttf", "fake font");

    const FontCatalog catalog(fonts_dir, {
        {"Pacifico:style=Regular", "Pacifico-Regular.ttf"},
        {"Lobster:style=Regular", "Lobster-Regular.ttf"}
    });
    const FontResolver resolver(catalog);

    require(catalog.size() == 2, "catalog holds both entries");
    require(catalog.contains("Pacifico:style=Regular"), "catalog contains Pacifico");
    require(!catalog.contains("Pacifico"), "lookup is by exact key");
    require(catalog.fonts_dir().is_absolute(), "fonts directory is stored absolute");

    require(resolver.resolve("Pacifico:style=Regular") == "Pacifico-Regular.ttf",
            "present font resolves to its bare filename");

    auto unknown = resolve_failure([&] { resolver.resolve("Comic Sans:style=Regular"); });
    require(unknown == FailureKind::UnknownFont, "unknown key fails with UnknownFont");

    auto traversal = resolve_failure([&] { resolver.resolve("../../etc/passwd"); });
    require(traversal == FailureKind::UnknownFont, "path-like key is just an unknown key");

    auto missing = resolve_failure([&] { resolver.resolve("Lobster:style=Regular"); });
    require(missing == FailureKind::MissingFontAsset, "catalogued but absent file fails with MissingFontAsset");

    try {
        resolver.resolve("Nope");
    } catch (const GenerationError& e) {
        require(std::string(e.what()) == "Font \"Nope\" is not available", "UnknownFont message names the key");
    }

    test::write_file(fonts_dir / "Lobster-Regular.ttf", "fake font");
    require(resolver.resolve("Lobster:style=Regular") == "Lobster-Regular.ttf",
            "file presence is checked at request time");
}

void test_validation(const std::filesystem::path& fonts_dir) {
    test::section("catalog validation");
    require(throws_invalid_argument([&] { (void)FontCatalog(fonts_dir, {{"Evil", "../evil.ttf"}}); }),
            "filename with a directory component is rejected");
    require(throws_invalid_argument([&] { (void)FontCatalog(fonts_dir, {{"Dots", ".."}}); }),
            "'..' is rejected");
    require(throws_invalid_argument([&] { (void)FontCatalog(fonts_dir, {{"", "a.ttf"}}); }),
            "empty key is rejected");

    KeychainConfig config;
    config.fonts_dir = fonts_dir.string();
    config.default_font = "Missing:style=Regular";
    require(throws_invalid_argument([&] { FontCatalog::from_config(config); }),
            "default font must be a catalog key");

    config.default_font = kDefaultFontKey;
    require(FontCatalog::from_config(config).size() == 2, "built-in catalog loads from config");
}

void test_display_name() {
    test::section("display name");
    require(font_display_name("Pacifico:style=Regular") == "Pacifico", "text before the first colon");
    require(font_display_name("Plain") == "Plain", "key without a colon is used whole");
}

} // namespace

int main() {
    ScopedWorkspace scratch("", "keyforge-fonts-test-");
    test_resolution(scratch.path());
    test_validation(scratch.path());
    test_display_name();
    return test::summary("FontCatalogTest");
}
