/**
 * @file RequestDecoder.cpp
 * @brief Decodes /generate-stl JSON bodies into generation requests
 */

#include "RequestDecoder.hpp"

namespace keyforge {

using json = nlohmann::json;

GenerationRequest RequestDecoder::decode(const std::string& body) const {
    json document;
    try {
        document = json::parse(body);
    } catch (const json::parse_error& e) {
        throw GenerationError(FailureKind::InvalidInput,
                              std::string("Request body is not valid JSON: ") + e.what());
    }
    return decode(document);
}

GenerationRequest RequestDecoder::decode(const json& document) const {
    if (!document.is_object()) {
        throw GenerationError(FailureKind::InvalidInput, "Request body must be a JSON object");
    }

    GenerationRequest request;

    auto name = document.find("name");
    if (name != document.end() && name->is_string()) {
        request.raw_name = name->get<std::string>();
    }

    auto font = document.find("font");
    if (font == document.end() || font->is_null()) {
        request.font_key = default_font_;
    } else if (font->is_string()) {
        request.font_key = font->get<std::string>();
    } else {
        throw GenerationError(FailureKind::UnknownFont,
                              "Font \"" + font->dump() + "\" is not available");
    }

    request.text_height = read_distance(document, "textHeight", request.text_height);
    request.border_thickness = read_distance(document, "borderThickness", request.border_thickness);
    request.width_option = read_distance(document, "widthOption", request.width_option);
    return request;
}

double RequestDecoder::read_distance(const json& document, const char* key, double fallback) const {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_number()) {
        return it->get<double>();
    }
    if (it->is_string()) {
        try {
            return unit_parser_.parse_print_distance(it->get<std::string>()).value;
        } catch (const UnitParseError& e) {
            throw GenerationError(FailureKind::InvalidInput,
                                  std::string("Invalid ") + key + ": " + e.what());
        }
    }
    throw GenerationError(FailureKind::InvalidInput,
                          std::string("Invalid ") + key + ": expected a number");
}

} // namespace keyforge
