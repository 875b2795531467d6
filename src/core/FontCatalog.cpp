/**
 * @file FontCatalog.cpp
 * @brief Implementation of the font catalog and resolver
 */

#include "FontCatalog.hpp"
#include <stdexcept>

namespace keyforge {

namespace {

bool is_bare_filename(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

} // namespace

std::string font_display_name(const std::string& font_key) {
    return font_key.substr(0, font_key.find(':'));
}

FontCatalog::FontCatalog(const std::filesystem::path& fonts_dir,
                         const std::map<std::string, std::string>& entries)
    : fonts_dir_(std::filesystem::absolute(fonts_dir).lexically_normal()) {
    for (const auto& [key, filename] : entries) {
        if (key.empty()) {
            throw std::invalid_argument("Font catalog contains an empty key");
        }
        if (!is_bare_filename(filename)) {
            throw std::invalid_argument("Font \"" + key + "\" must name a file directly inside " +
                                        "the fonts directory, got \"" + filename + "\"");
        }
        entries_.emplace(key, FontCatalogEntry{key, filename});
    }
}

FontCatalog FontCatalog::from_config(const KeychainConfig& config) {
    FontCatalog catalog(config.fonts_dir, config.fonts);
    if (!catalog.contains(config.default_font)) {
        throw std::invalid_argument("Default font \"" + config.default_font +
                                    "\" is not in the font catalog");
    }
    return catalog;
}

const FontCatalogEntry* FontCatalog::find(const std::string& key) const {
    auto it = entries_.find(key);
    return it != entries_.end() ? &it->second : nullptr;
}

std::filesystem::path FontCatalog::path_of(const FontCatalogEntry& entry) const {
    return fonts_dir_ / entry.filename;
}

std::vector<std::string> FontCatalog::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        result.push_back(key);
    }
    return result;
}

FontResolver::FontResolver(const FontCatalog& catalog)
    : catalog_(catalog)
    , logger_("FontResolver")
{
}

std::string FontResolver::resolve(const std::string& font_key) const {
    const FontCatalogEntry* entry = catalog_.find(font_key);
    if (!entry) {
        logger_.detailed("Rejected font key \"" + font_key + "\"");
        throw GenerationError(FailureKind::UnknownFont,
                              "Font \"" + font_key + "\" is not available");
    }

    const auto font_path = catalog_.path_of(*entry);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(font_path, ec)) {
        logger_.error("Font file for \"" + font_key + "\" not found at " + font_path.string() +
                      (ec ? " (" + ec.message() + ")" : ""));
        throw GenerationError(FailureKind::MissingFontAsset,
                              "Font file \"" + entry->filename + "\" not found in fonts directory");
    }

    logger_.debug("Resolved font \"" + font_key + "\" to " + entry->filename);
    return entry->filename;
}

} // namespace keyforge
