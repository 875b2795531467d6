/**
 * @file ScadSceneWriter.hpp
 * @brief Synthesizes the OpenSCAD program for a keychain
 *
 * The program unions two solids:
 * - text_part(): a border shell (text offset outward by the border thickness,
 *   extruded to the border thickness) with the filled text extruded on top
 * - hole_tab(): an 8 mm disc with a 4 mm through-hole, moved to (-offset, 0, 0)
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace keyforge {

/**
 * @brief Inputs of one scene
 */
struct SceneParameters {
    std::string text;              ///< Sanitized label
    std::string font_file;         ///< Bare font filename from the catalog
    double text_height = 3.0;      ///< Extrusion of the filled text above the border
    double border_thickness = 2.0; ///< Border shell and tab height
    double font_size = 15.0;       ///< OpenSCAD text size (width option)
    double hole_offset = 0.0;      ///< From HoleLayout
};

/**
 * @brief Finished OpenSCAD program text
 *
 * Created once per request and read-only from then on.
 */
class SceneDescription {
public:
    explicit SceneDescription(std::string source) : source_(std::move(source)) {}

    const std::string& source() const { return source_; }
    std::size_t size() const { return source_.size(); }

private:
    std::string source_;
};

/**
 * @brief Writes keychain scenes in OpenSCAD syntax
 */
class ScadSceneWriter {
public:
    static constexpr double kTabDiameter = 8.0;
    static constexpr double kHoleDiameter = 4.0;
    /// Hole extends this far past both tab faces so the subtraction is clean
    static constexpr double kHoleOvershoot = 0.1;

    /**
     * @param facet_count OpenSCAD $fn for curved primitives
     */
    explicit ScadSceneWriter(int facet_count = 12);

    SceneDescription write(const SceneParameters& params) const;

    /**
     * @brief Quote a value as an OpenSCAD string literal
     *
     * Backslash and double quote are escaped; control characters are dropped.
     */
    static std::string quote(const std::string& value);

    /**
     * @brief Locale-independent number formatting, 10 significant digits
     */
    static std::string format_number(double value);

private:
    int facet_count_;
};

} // namespace keyforge
