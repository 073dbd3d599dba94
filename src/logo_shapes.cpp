#include <array>
#include <cmath>

#ifdef INCLUDE_TESTS
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#endif

#include <aixlog.hpp>

#include "errors.hpp"
#include "geometry.hpp"
#include "glyph_set.hpp"
#include "logo_shapes.hpp"
#include "shape2d.hpp"
#include "stroke_buffer.hpp"


// artwork, from the 48x48 icon
static const double art_cx = 24, art_cy = 24;

static const std::array<gp_Pnt2d, 5> art_mountain = {{
	{6, 36}, {16, 14}, {22, 22}, {32, 8}, {42, 36},
}};

struct quad_bezier {
	gp_Pnt2d p0, p1, p2;
};

static const std::array<quad_bezier, 3> art_trail = {{
	{{10, 32}, {16, 26}, {22, 30}},
	{{22, 30}, {28, 34}, {34, 28}},
	{{34, 28}, {38, 24}, {42, 26}},
}};
static const double art_trail_stroke = 3.0;

static const std::array<gp_Pnt2d, 4> art_bolt = {{
	{34, 14}, {38, 22}, {32, 22}, {36, 32},
}};
static const double art_bolt_stroke = 2.5;

static const int bezier_segments = 20;
static const int stroke_cap_segments = 8;

double
logo_scale(double diameter)
{
	return diameter / logo_art_diameter;
}

gp_Pnt2d
logo_art_to_local(double x, double y, double scale)
{
	return gp_Pnt2d((x - art_cx) * scale, -(y - art_cy) * scale);
}

std::vector<gp_Pnt2d>
logo_trail_centreline(double scale)
{
	std::vector<gp_Pnt2d> pts;
	for (const auto &seg : art_trail) {
		auto sampled = sample_quadratic_bezier(seg.p0, seg.p1, seg.p2, bezier_segments);
		// segments share their join point
		auto first = sampled.begin();
		if (!pts.empty()) {
			++first;
		}
		for (auto it = first; it != sampled.end(); ++it) {
			pts.push_back(logo_art_to_local(it->X(), it->Y(), scale));
		}
	}
	return pts;
}

template <size_t N> static std::vector<gp_Pnt2d>
art_points_to_local(const std::array<gp_Pnt2d, N> &art, double scale)
{
	std::vector<gp_Pnt2d> pts;
	for (const auto &p : art) {
		pts.push_back(logo_art_to_local(p.X(), p.Y(), scale));
	}
	return pts;
}

static TopoDS_Shape
stroke_shape(const std::vector<gp_Pnt2d> &centreline, double stroke_width, const char *what)
{
	const auto outline = buffer_path(centreline, stroke_width / 2, stroke_cap_segments);
	if (outline.empty()) {
		throw relief_error(std::string("unable to stroke ") + what);
	}
	return make_polygon_face(outline);
}

logo_shapes
create_logo_shapes(double diameter)
{
	if (!(diameter > 0)) {
		throw invalid_parameter("logo diameter must be positive");
	}

	const double scale = logo_scale(diameter);

	logo_shapes shapes;
	shapes.circle = make_disc_face(diameter);

	shapes.mountain = perform_boolean(
		BOPAlgo_COMMON,
		make_polygon_face(art_points_to_local(art_mountain, scale)),
		shapes.circle, "mountain");

	shapes.trail = perform_boolean(
		BOPAlgo_COMMON,
		stroke_shape(logo_trail_centreline(scale), art_trail_stroke * scale, "trail"),
		shapes.circle, "trail");

	shapes.bolt = perform_boolean(
		BOPAlgo_COMMON,
		stroke_shape(art_points_to_local(art_bolt, scale), art_bolt_stroke * scale, "bolt"),
		shapes.circle, "bolt");

	LOG(DEBUG) << "built logo shapes at " << diameter << "mm, scale=" << scale << '\n';

	return shapes;
}

logotext_shapes
create_logotext_shapes(double diameter, const std::string &text)
{
	// text is checked before the logo is built
	for (const char ch : text) {
		lookup_glyph(ch);
	}

	logotext_shapes shapes;
	shapes.logo = create_logo_shapes(diameter);

	const double
		cap_height = diameter * logotext_cap_ratio,
		x_start = diameter / 2 + diameter * logotext_gap_ratio;

	const auto assembled = assemble_text(text, cap_height);

	// the baseline is at y=0, centre the glyph extents on the logo instead
	const auto b = shape_bounds(assembled);
	shapes.text = translate_shape(assembled, x_start, -(b.ymin + b.ymax) / 2);

	return shapes;
}

#ifdef INCLUDE_TESTS
TEST_CASE("logo artwork transform") {
	using Catch::Approx;

	const double scale = logo_scale(22);
	CHECK(scale == Approx(0.5));

	const auto centre = logo_art_to_local(24, 24, scale);
	CHECK(centre.X() == Approx(0).margin(1e-12));
	CHECK(centre.Y() == Approx(0).margin(1e-12));

	// top of the artwork is +Y locally
	CHECK(logo_art_to_local(24, 2, scale).Y() == Approx(11));
	CHECK(logo_art_to_local(46, 24, scale).X() == Approx(11));

	const auto trail = logo_trail_centreline(scale);
	CHECK(trail.size() == 3 * bezier_segments + 1);
	CHECK(trail.front().IsEqual(logo_art_to_local(10, 32, scale), 1e-12));
	CHECK(trail.back().IsEqual(logo_art_to_local(42, 26, scale), 1e-12));
}

TEST_CASE("create_logo_shapes") {
	using Catch::Approx;

	const double diameter = 18, r = diameter / 2;
	const auto shapes = create_logo_shapes(diameter);

	const double circle_area = M_PI * r * r;
	CHECK(area_of_shape(shapes.circle) == Approx(circle_area));

	SECTION("mountain lies wholly inside the circle") {
		const double scale = logo_scale(diameter);
		polygon2d poly;
		for (const auto &p : art_mountain) {
			poly.push_back(logo_art_to_local(p.X(), p.Y(), scale));
		}
		CHECK(area_of_shape(shapes.mountain) == Approx(std::abs(signed_area(poly))));
	}

	SECTION("every element is clipped to the circle") {
		for (const auto &shape : {shapes.mountain, shapes.trail, shapes.bolt}) {
			const double area = area_of_shape(shape);
			CHECK(area > 0);
			CHECK(area < circle_area);

			const auto b = shape_bounds(shape);
			CHECK(b.xmin >= -r - 1e-5);
			CHECK(b.xmax <= r + 1e-5);
			CHECK(b.ymin >= -r - 1e-5);
			CHECK(b.ymax <= r + 1e-5);
		}
	}

	CHECK_THROWS_AS(create_logo_shapes(0), invalid_parameter);
}

TEST_CASE("create_logotext_shapes") {
	using Catch::Approx;

	const double diameter = 18;
	const auto shapes = create_logotext_shapes(diameter, "TrailCurrent");

	const auto b = shape_bounds(shapes.text);
	CHECK(b.xmin == Approx(diameter / 2 + diameter * logotext_gap_ratio).margin(1e-5));
	CHECK((b.ymin + b.ymax) / 2 == Approx(0).margin(1e-5));
	CHECK(b.ymax - b.ymin == Approx(diameter * logotext_cap_ratio).margin(1e-5));

	// nothing of the text reaches into the logo
	CHECK_FALSE(shape_has_solids(shapes.text));
	CHECK(area_of_shape(perform_boolean(BOPAlgo_COMMON, shapes.text, shapes.logo.circle, "test")) == Approx(0).margin(1e-9));

	CHECK_THROWS_AS(create_logotext_shapes(diameter, "Trail!"), unsupported_character);
}
#endif
