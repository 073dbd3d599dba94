#pragma once

#include <string>
#include <vector>

#include <TopoDS_Shape.hxx>

#include "shape2d.hpp"


// block letters are drawn in design units with these proportions, origin at
// the bottom-left of each glyph
const double glyph_cap_height = 10;
const double glyph_x_height = 7;
const double glyph_stroke = 1.8;
// gap added after every advance
const double glyph_spacing = 1;

struct glyph_definition {
	double advance_width;
	std::vector<polygon2d> outers, holes;
};

bool has_glyph(char ch);

// throws unsupported_character
const glyph_definition& lookup_glyph(char ch);

// characters of the fixed table, in no particular order
std::string supported_characters();

// single glyph scaled and moved so its origin sits at (x_offset, 0), holes
// already cut out
TopoDS_Shape build_glyph_shape(char ch, double x_offset, double scale);

// width of text in the same units as cap_height, without the trailing gap
double text_advance(const std::string &text, double cap_height);

/* lays text out left to right on the baseline y=0 starting at x=0 and fuses
 * the glyphs into one shape. every character is checked before any geometry
 * is built, so an unsupported one throws without a partial result
 */
TopoDS_Shape assemble_text(const std::string &text, double cap_height);
