/**
 * @file ScadSceneWriter.cpp
 * @brief Implementation of OpenSCAD scene synthesis
 */

#include "ScadSceneWriter.hpp"
#include <iomanip>
#include <locale>
#include <sstream>

namespace keyforge {

ScadSceneWriter::ScadSceneWriter(int facet_count)
    : facet_count_(facet_count) {
}

std::string ScadSceneWriter::quote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (uc >= 0x20 && uc != 0x7f) {
            out.push_back(c);
        }
    }
    out.push_back('"');
    return out;
}

std::string ScadSceneWriter::format_number(double value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(10) << value;
    return oss.str();
}

SceneDescription ScadSceneWriter::write(const SceneParameters& params) const {
    const std::string border = format_number(params.border_thickness);
    const std::string text_call =
        "text(" + quote(params.text) +
        ", size=" + format_number(params.font_size) +
        ", font=" + quote(params.font_file) +
        ", halign=\"center\", valign=\"center\");";

    std::ostringstream scad;
    scad.imbue(std::locale::classic());

    scad << "$fn=" << facet_count_ << ";\n"
         << "\n"
         << "module text_part() {\n"
         << "    linear_extrude(height=" << border << ")\n"
         << "        offset(delta=" << border << ")\n"
         << "        " << text_call << "\n"
         << "    translate([0,0," << border << "])\n"
         << "        linear_extrude(height=" << format_number(params.text_height) << ")\n"
         << "            " << text_call << "\n"
         << "}\n"
         << "\n"
         << "module hole_tab() {\n"
         << "    difference() {\n"
         << "        cylinder(h=" << border << ", d=" << format_number(kTabDiameter) << ");\n"
         << "        translate([0,0," << format_number(-kHoleOvershoot) << "])\n"
         << "            cylinder(h=" << format_number(params.border_thickness + 2.0 * kHoleOvershoot)
         << ", d=" << format_number(kHoleDiameter) << ");\n"
         << "    }\n"
         << "}\n"
         << "\n"
         << "union() {\n"
         << "    text_part();\n"
         << "    translate([" << format_number(-params.hole_offset) << ", 0, 0])\n"
         << "        hole_tab();\n"
         << "}\n";

    return SceneDescription(scad.str());
}

} // namespace keyforge
