/**
 * @file NameSanitizer.hpp
 * @brief Normalizes untrusted keychain label text
 *
 * The sanitized label is embedded verbatim in a generated OpenSCAD program,
 * so the allowed alphabet deliberately excludes quotes, backslashes and any
 * other character with meaning inside a string literal.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <cstddef>
#include <string>

namespace keyforge {

/**
 * @brief Filters a label down to [A-Za-z0-9 _-] and bounds its length
 */
class NameSanitizer {
public:
    /// Maximum label length after filtering
    static constexpr std::size_t kMaxLength = 20;

    /**
     * @brief Check a single character against the allowed alphabet
     */
    static bool is_allowed(char c);

    /**
     * @brief Remove disallowed characters, then keep the first kMaxLength
     *
     * Empty input (or input with no allowed characters) yields an empty
     * label; that is accepted downstream.
     *
     * @param raw Untrusted label text (any bytes, typically UTF-8)
     * @return Sanitized label
     */
    static std::string sanitize(const std::string& raw);
};

} // namespace keyforge
