/**
 * @file HoleLayout.cpp
 * @brief Implementation of the hole-tab offset
 */

#include "HoleLayout.hpp"

namespace keyforge {

double HoleLayout::border_factor(std::size_t name_length) {
    const double n = static_cast<double>(name_length);
    return kBaseBorderFactor + (n - kReferenceLength) * kBorderFactorStep;
}

double HoleLayout::hole_offset(std::size_t name_length, double width_option,
                               double border_thickness) {
    const double n = static_cast<double>(name_length);
    const double half_text_width = n * width_option * kCharWidthRatio / 2.0;
    return half_text_width + border_thickness * border_factor(name_length);
}

} // namespace keyforge
