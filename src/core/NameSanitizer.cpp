/**
 * @file NameSanitizer.cpp
 * @brief Implementation of label sanitization
 */

#include "NameSanitizer.hpp"

namespace keyforge {

bool NameSanitizer::is_allowed(char c) {
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == ' ' || c == '_' || c == '-';
}

std::string NameSanitizer::sanitize(const std::string& raw) {
    std::string result;
    result.reserve(kMaxLength);

    // Multi-byte UTF-8 sequences consist of bytes >= 0x80 and drop out whole
    for (char c : raw) {
        if (!is_allowed(c)) continue;
        result.push_back(c);
        if (result.size() == kMaxLength) break;
    }
    return result;
}

} // namespace keyforge
