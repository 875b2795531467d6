/**
 * @file FontCatalog.hpp
 * @brief Closed catalog of label fonts and request-time font resolution
 *
 * The catalog maps a fixed set of font keys ("Pacifico:style=Regular") to
 * bare font filenames inside a single fonts directory. It is built once at
 * startup and never modified; FontResolver looks keys up per request and
 * verifies the backing file is still present.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "keychain_generator.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace keyforge {

/**
 * @brief One catalog entry
 */
struct FontCatalogEntry {
    std::string key;        ///< Request-facing identifier, e.g. "Lobster:style=Regular"
    std::string filename;   ///< Bare filename inside the fonts directory
};

/**
 * @brief Display name of a font key: the text before the first ':'
 *
 * "Pacifico:style=Regular" -> "Pacifico"
 */
std::string font_display_name(const std::string& font_key);

/**
 * @brief Immutable key -> font file mapping rooted at one directory
 */
class FontCatalog {
public:
    /**
     * @brief Build a catalog
     *
     * @param fonts_dir Directory holding the font files (made absolute)
     * @param entries Key -> filename pairs
     * @throws std::invalid_argument if a filename is not a bare file name
     *         (contains a directory separator, or is "." / "..") or a key is empty
     */
    FontCatalog(const std::filesystem::path& fonts_dir,
                const std::map<std::string, std::string>& entries);

    /**
     * @brief Build the catalog described by a service configuration
     * @throws std::invalid_argument as above, or if default_font is not a key
     */
    static FontCatalog from_config(const KeychainConfig& config);

    /**
     * @brief Look up a key
     * @return Entry, or nullptr when the key is not in the catalog
     */
    const FontCatalogEntry* find(const std::string& key) const;

    bool contains(const std::string& key) const { return find(key) != nullptr; }

    /**
     * @brief Absolute path an entry's file is expected at
     */
    std::filesystem::path path_of(const FontCatalogEntry& entry) const;

    const std::filesystem::path& fonts_dir() const { return fonts_dir_; }
    std::vector<std::string> keys() const;
    std::size_t size() const { return entries_.size(); }

private:
    std::filesystem::path fonts_dir_;
    std::map<std::string, FontCatalogEntry> entries_;
};

/**
 * @brief Resolves request font keys against a catalog
 */
class FontResolver {
public:
    /**
     * @param catalog Catalog to resolve against; must outlive the resolver
     */
    explicit FontResolver(const FontCatalog& catalog);

    /**
     * @brief Resolve a key to the font filename handed to the render engine
     *
     * @param font_key Key from the request
     * @return Bare filename (never a path)
     * @throws GenerationError UnknownFont if the key is not in the catalog
     * @throws GenerationError MissingFontAsset if the file is not on disk
     */
    std::string resolve(const std::string& font_key) const;

private:
    const FontCatalog& catalog_;
    Logger logger_;
};

} // namespace keyforge
