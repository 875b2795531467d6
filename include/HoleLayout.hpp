/**
 * @file HoleLayout.hpp
 * @brief Places the keychain hole tab relative to the label text
 *
 * The tab sits to the left of the centered text. Its distance from the text
 * origin grows smoothly with label length: half the estimated text width
 * plus a border allowance whose factor rises 0.1 per character.
 *
 *   border_factor = 2.0 + (n - 2) * 0.1
 *   offset        = n * width_option * 0.57 / 2 + border_thickness * border_factor
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <cstddef>

namespace keyforge {

/**
 * @brief Pure hole-tab offset computation
 */
class HoleLayout {
public:
    /// Approximate glyph advance as a fraction of the font size
    static constexpr double kCharWidthRatio = 0.57;
    /// Border factor at the reference length
    static constexpr double kBaseBorderFactor = 2.0;
    /// Border factor increase per character
    static constexpr double kBorderFactorStep = 0.1;
    /// Label length at which the border factor equals kBaseBorderFactor
    static constexpr double kReferenceLength = 2.0;

    /**
     * @brief Border allowance multiplier for a label length
     *
     * n = 0 gives 1.8; there is no lower clamp.
     */
    static double border_factor(std::size_t name_length);

    /**
     * @brief Lateral distance of the tab center from the text origin (mm)
     * @param name_length Sanitized label length
     * @param width_option Font size passed to the text() primitive
     * @param border_thickness Border shell thickness
     * @return Positive offset; the tab is translated to (-offset, 0, 0)
     */
    static double hole_offset(std::size_t name_length, double width_option,
                              double border_thickness);
};

} // namespace keyforge
