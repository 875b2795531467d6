/**
 * @file RequestDecoder.hpp
 * @brief Decodes /generate-stl JSON bodies into generation requests
 */

#pragma once

#include "keychain_generator.hpp"
#include "UnitParser.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace keyforge {

/**
 * @brief JSON request body -> GenerationRequest
 *
 * Recognised members: name, font, textHeight, borderThickness, widthOption.
 * Missing or null members take their defaults; a non-string name falls back
 * to the default label. Distances may be JSON numbers or strings with an
 * optional mm/cm/in suffix.
 *
 * Positivity of the distances is checked by the pipeline, not here.
 */
class RequestDecoder {
public:
    explicit RequestDecoder(std::string default_font) : default_font_(std::move(default_font)) {}

    /**
     * @throws GenerationError InvalidInput for malformed JSON, a non-object
     *         body or an unparseable distance; UnknownFont for a non-string font
     */
    GenerationRequest decode(const std::string& body) const;

    /// @copydoc decode(const std::string&) const
    GenerationRequest decode(const nlohmann::json& document) const;

private:
    double read_distance(const nlohmann::json& document, const char* key, double fallback) const;

    std::string default_font_;
    UnitParser unit_parser_;
};

} // namespace keyforge
