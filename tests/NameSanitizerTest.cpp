// NameSanitizerTest.cpp
//
// Character filtering and truncation of keychain labels.

#include "NameSanitizer.hpp"
#include "TestSupport.hpp"

using namespace keyforge;
using keyforge::test::require;

namespace {

void test_filtering() {
    test::section("filtering");
    require(NameSanitizer::sanitize("Hello World") == "Hello World", "plain text is unchanged");
    require(NameSanitizer::sanitize("Ann-Marie_2") == "Ann-Marie_2", "hyphen, underscore and digits kept");
    require(NameSanitizer::sanitize("<script>alert(1)</script>") == "scriptalert1script",
            "markup characters are removed");
    require(NameSanitizer::sanitize("a\"b\\c;d") == "abcd", "quotes, backslash and semicolon removed");
    require(NameSanitizer::sanitize("caf\xC3\xA9") == "caf", "multi-byte characters removed whole");
    require(NameSanitizer::sanitize("tab\there\nnl") == "tabherenl", "control characters removed");
    require(NameSanitizer::sanitize("") == "", "empty input yields empty output");
    require(NameSanitizer::sanitize("!!!") == "", "all-illegal input yields empty output");
}

void test_truncation() {
    test::section("truncation");
    const std::string twenty = "ABCDEFGHIJKLMNOPQRST";
    require(NameSanitizer::sanitize(twenty) == twenty, "exactly 20 characters kept");
    require(NameSanitizer::sanitize(twenty + "UVW") == twenty, "longer input truncated to 20");
    require(NameSanitizer::sanitize("!!A!!B" + std::string(40, 'x')).size() == NameSanitizer::kMaxLength,
            "truncation applies after filtering");
    require(NameSanitizer::sanitize("**" + twenty) == twenty,
            "leading illegal characters do not count toward the limit");
}

void test_properties() {
    test::section("properties");
    const std::string samples[] = {
        "Keychain", "  spaced  ", "UPPER lower 123", "\x01\x02\x7f", "a/b/../c", "x$y%z^&*()",
        "0123456789012345678901234567890123456789", "\xF0\x9F\x94\x91 key"
    };
    bool all_allowed = true;
    bool all_bounded = true;
    bool all_idempotent = true;
    for (const auto& raw : samples) {
        const std::string clean = NameSanitizer::sanitize(raw);
        for (char c : clean) {
            all_allowed = all_allowed && NameSanitizer::is_allowed(c);
        }
        all_bounded = all_bounded && clean.size() <= NameSanitizer::kMaxLength;
        all_idempotent = all_idempotent && NameSanitizer::sanitize(clean) == clean;
    }
    require(all_allowed, "output contains only allowed characters");
    require(all_bounded, "output never exceeds 20 characters");
    require(all_idempotent, "sanitizing twice changes nothing");
}

} // namespace

int main() {
    test_filtering();
    test_truncation();
    test_properties();
    return test::summary("NameSanitizerTest");
}
