#include <algorithm>
#include <cmath>
#include <map>

#ifdef INCLUDE_TESTS
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#endif

#include <aixlog.hpp>

#include "errors.hpp"
#include "geometry.hpp"
#include "glyph_set.hpp"


// bold geometric block forms, every stroke is glyph_stroke wide so they read
// well as a shallow relief. counters are separate hole polygons
static const std::map<char, glyph_definition> &
glyph_table()
{
	static const std::map<char, glyph_definition> table = {
		// capitals
		{'T', {7.0,
			{{{0, 10}, {7, 10}, {7, 8.2}, {4.4, 8.2},
			  {4.4, 0}, {2.6, 0}, {2.6, 8.2}, {0, 8.2}}},
			{}}},
		{'C', {5.4,
			{{{0, 0}, {5.4, 0}, {5.4, 1.8}, {1.8, 1.8},
			  {1.8, 8.2}, {5.4, 8.2}, {5.4, 10}, {0, 10}}},
			{}}},

		// lowercase
		{'r', {3.8,
			{{{0, 0}, {1.8, 0}, {1.8, 5.2}, {3.8, 5.2},
			  {3.8, 7}, {0, 7}}},
			{}}},
		{'a', {5.4,
			{{{0, 0}, {5.4, 0}, {5.4, 7}, {0, 7}}},
			{{{1.8, 1.8}, {3.6, 1.8}, {3.6, 5.2}, {1.8, 5.2}}}}},
		{'i', {1.8,
			{{{0, 0}, {1.8, 0}, {1.8, 7}, {0, 7}},
			 {{0, 8.2}, {1.8, 8.2}, {1.8, 10}, {0, 10}}},
			{}}},
		{'l', {1.8,
			{{{0, 0}, {1.8, 0}, {1.8, 10}, {0, 10}}},
			{}}},
		{'u', {5.4,
			{{{0, 0}, {5.4, 0}, {5.4, 7}, {3.6, 7},
			  {3.6, 1.8}, {1.8, 1.8}, {1.8, 7}, {0, 7}}},
			{}}},
		{'e', {5.4,
			{{{0, 0}, {5.4, 0}, {5.4, 2.6}, {1.8, 2.6},
			  {1.8, 4.4}, {5.4, 4.4}, {5.4, 7}, {0, 7}}},
			{}}},
		{'n', {5.4,
			{{{0, 0}, {1.8, 0}, {1.8, 5.2}, {3.6, 5.2},
			  {3.6, 0}, {5.4, 0}, {5.4, 7}, {0, 7}}},
			{}}},
		{'t', {4.2,
			{{{0, 0}, {1.8, 0}, {1.8, 5.2}, {4.2, 5.2},
			  {4.2, 7}, {1.8, 7}, {1.8, 10}, {0, 10}}},
			{}}},
	};
	return table;
}

bool
has_glyph(char ch)
{
	return glyph_table().count(ch) > 0;
}

const glyph_definition&
lookup_glyph(char ch)
{
	const auto &table = glyph_table();
	const auto it = table.find(ch);
	if (it == table.end()) {
		throw unsupported_character(ch);
	}
	return it->second;
}

std::string
supported_characters()
{
	std::string chars;
	for (const auto &entry : glyph_table()) {
		chars += entry.first;
	}
	return chars;
}

static polygon2d
place_polygon(const polygon2d &poly, double x_offset, double scale)
{
	polygon2d out;
	out.reserve(poly.size());
	for (const auto &p : poly) {
		out.emplace_back(p.X() * scale + x_offset, p.Y() * scale);
	}
	return out;
}

TopoDS_Shape
build_glyph_shape(char ch, double x_offset, double scale)
{
	const auto &glyph = lookup_glyph(ch);
	if (glyph.outers.empty()) {
		throw relief_error(std::string("glyph '") + ch + "' has no outline");
	}

	std::vector<TopoDS_Shape> outers;
	for (const auto &poly : glyph.outers) {
		outers.push_back(make_polygon_face(place_polygon(poly, x_offset, scale)));
	}

	// stem and dot of an 'i' become one shape
	TopoDS_Shape result = fuse_all(outers, "glyph outline");

	for (const auto &poly : glyph.holes) {
		const auto hole = make_polygon_face(place_polygon(poly, x_offset, scale));
		result = perform_boolean(BOPAlgo_CUT, result, hole, "glyph counter");
	}

	return result;
}

double
text_advance(const std::string &text, double cap_height)
{
	const double scale = cap_height / glyph_cap_height;
	double width = 0;
	for (const char ch : text) {
		width += (lookup_glyph(ch).advance_width + glyph_spacing) * scale;
	}
	if (!text.empty()) {
		width -= glyph_spacing * scale;
	}
	return width;
}

TopoDS_Shape
assemble_text(const std::string &text, double cap_height)
{
	if (text.empty()) {
		throw invalid_parameter("no text to assemble");
	}
	if (!(cap_height > 0)) {
		throw invalid_parameter("text cap height must be positive");
	}

	// fail before any geometry exists
	for (const char ch : text) {
		lookup_glyph(ch);
	}

	const double scale = cap_height / glyph_cap_height;
	double cursor = 0;

	std::vector<TopoDS_Shape> glyphs;
	glyphs.reserve(text.size());
	for (const char ch : text) {
		glyphs.push_back(build_glyph_shape(ch, cursor, scale));
		cursor += (lookup_glyph(ch).advance_width + glyph_spacing) * scale;
	}

	LOG(DEBUG)
		<< "assembled " << text.size() << " glyphs, "
		<< cursor - glyph_spacing * scale << " wide\n";

	return fuse_all(glyphs, "text");
}

#ifdef INCLUDE_TESTS
static double
polygon_set_area(const std::vector<polygon2d> &polys)
{
	double area = 0;
	for (const auto &p : polys) {
		area += std::abs(signed_area(p));
	}
	return area;
}

TEST_CASE("glyph table") {
	SECTION("holes sit inside the outline") {
		for (const char ch : supported_characters()) {
			const auto &g = lookup_glyph(ch);
			CHECK(g.advance_width > 0);
			CHECK_FALSE(g.outers.empty());
			CHECK(polygon_set_area(g.holes) < polygon_set_area(g.outers));
			for (const auto &poly : g.outers) {
				for (const auto &p : poly) {
					CHECK(p.X() >= 0);
					CHECK(p.X() <= g.advance_width);
					CHECK(p.Y() >= 0);
					CHECK(p.Y() <= glyph_cap_height);
				}
			}
		}
	}
	SECTION("glyphs reach cap height or x-height") {
		for (const char ch : supported_characters()) {
			double top = 0;
			for (const auto &poly : lookup_glyph(ch).outers) {
				for (const auto &p : poly) {
					top = std::max(top, p.Y());
				}
			}
			CHECK((top == glyph_cap_height || top == glyph_x_height));
		}
	}
	SECTION("unknown characters") {
		CHECK_FALSE(has_glyph('Z'));
		CHECK_FALSE(has_glyph(' '));
		CHECK_THROWS_AS(lookup_glyph('Z'), unsupported_character);
	}
}

TEST_CASE("build_glyph_shape") {
	using Catch::Approx;

	SECTION("counter of 'a' is removed") {
		const double scale = 2;
		const double w = 5.4, counter = glyph_x_height - 2 * glyph_stroke;
		const double expected = (w * glyph_x_height - (w - 2 * glyph_stroke) * counter) * scale * scale;
		CHECK(area_of_shape(build_glyph_shape('a', 0, scale)) == Approx(expected));
	}
	SECTION("both parts of 'i'") {
		CHECK(area_of_shape(build_glyph_shape('i', 3, 1)) == Approx(1.8 * 7 + 1.8 * 1.8));
		const auto b = shape_bounds(build_glyph_shape('i', 3, 1));
		CHECK(b.xmin == Approx(3).margin(1e-5));
		CHECK(b.xmax == Approx(4.8).margin(1e-5));
	}
}

TEST_CASE("assemble_text") {
	using Catch::Approx;

	SECTION("glyph areas add up, letters don't touch") {
		const double cap = 5, scale = cap / glyph_cap_height;
		const auto text = assemble_text("Tl", cap);
		const double t_area = (7 * 1.8 + 1.8 * 8.2) * scale * scale;
		const double l_area = 1.8 * 10 * scale * scale;
		CHECK(area_of_shape(text) == Approx(t_area + l_area));

		const auto b = shape_bounds(text);
		CHECK(b.xmin == Approx(0).margin(1e-5));
		CHECK(b.xmax == Approx(text_advance("Tl", cap)).margin(1e-5));
		CHECK(b.ymax == Approx(cap).margin(1e-5));
	}

	SECTION("unsupported characters are reported") {
		try {
			assemble_text("TrailZ", 5);
			FAIL("expected unsupported_character");
		} catch (const unsupported_character &err) {
			CHECK(err.character() == 'Z');
		}
	}

	SECTION("bad input") {
		CHECK_THROWS_AS(assemble_text("", 5), invalid_parameter);
		CHECK_THROWS_AS(assemble_text("T", 0), invalid_parameter);
	}
}
#endif
