#include <cmath>

#ifdef INCLUDE_TESTS
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#endif

#include "stroke_buffer.hpp"


// steps shorter than this carry no direction
static const double min_step = 1e-12;

std::vector<gp_Pnt2d>
sample_quadratic_bezier(
	const gp_Pnt2d &p0, const gp_Pnt2d &p1, const gp_Pnt2d &p2, int segments)
{
	std::vector<gp_Pnt2d> pts;
	pts.reserve((size_t)segments + 1);

	for (int i = 0; i <= segments; i++) {
		const double
			t = double(i) / segments,
			u = 1 - t;
		pts.emplace_back(
			u * u * p0.X() + 2 * u * t * p1.X() + t * t * p2.X(),
			u * u * p0.Y() + 2 * u * t * p1.Y() + t * t * p2.Y());
	}
	return pts;
}

static std::vector<gp_Pnt2d>
drop_repeated_points(const std::vector<gp_Pnt2d> &pts)
{
	std::vector<gp_Pnt2d> out;
	out.reserve(pts.size());
	for (const auto &p : pts) {
		if (out.empty() || out.back().Distance(p) >= min_step) {
			out.push_back(p);
		}
	}
	return out;
}

// unit tangent from a to b, both distinct
static inline gp_XY
unit_tangent(const gp_Pnt2d &a, const gp_Pnt2d &b)
{
	gp_XY d = b.XY() - a.XY();
	return d / d.Modulus();
}

// semicircle around centre, from angle begin sweeping pi in the frame of
// tangent d. only the interior points are emitted, the two ends coincide
// with the offset lines
static void
append_cap(
	polygon2d &out, const gp_Pnt2d &centre, const gp_XY &d,
	double half_width, double begin, int cap_segments)
{
	for (int i = 1; i < cap_segments; i++) {
		const double angle = begin + M_PI * i / cap_segments;
		const double c = std::cos(angle), s = std::sin(angle);
		out.emplace_back(
			centre.X() + half_width * (d.X() * c + d.Y() * s),
			centre.Y() + half_width * (d.Y() * c - d.X() * s));
	}
}

polygon2d
buffer_path(const std::vector<gp_Pnt2d> &centreline, double half_width, int cap_segments)
{
	const auto pts = drop_repeated_points(centreline);
	const size_t n = pts.size();
	if (n < 2 || !(half_width > 0)) {
		return {};
	}

	polygon2d left, right;
	left.reserve(n);
	right.reserve(n);

	for (size_t i = 0; i < n; i++) {
		// forward/backward difference at the ends, central inside
		const auto &a = pts[i == 0 ? 0 : i - 1];
		const auto &b = pts[i == n - 1 ? n - 1 : i + 1];

		gp_XY d = b.XY() - a.XY();
		const double len = d.Modulus();
		if (len < min_step) {
			// path doubles straight back on itself
			continue;
		}
		d /= len;

		// rotated a quarter turn anticlockwise
		const gp_XY nrm{-d.Y() * half_width, d.X() * half_width};

		left.emplace_back(pts[i].XY() + nrm);
		right.emplace_back(pts[i].XY() - nrm);
	}

	polygon2d outline;
	outline.reserve(left.size() + right.size() + 2 * (size_t)cap_segments);

	outline.insert(outline.end(), left.begin(), left.end());
	append_cap(
		outline, pts[n - 1], unit_tangent(pts[n - 2], pts[n - 1]),
		half_width, -M_PI / 2, cap_segments);
	outline.insert(outline.end(), right.rbegin(), right.rend());
	append_cap(
		outline, pts[0], unit_tangent(pts[0], pts[1]),
		half_width, M_PI / 2, cap_segments);

	return outline;
}

#ifdef INCLUDE_TESTS
TEST_CASE("sample_quadratic_bezier") {
	using Catch::Approx;

	const auto pts = sample_quadratic_bezier({0, 0}, {1, 2}, {2, 0}, 4);

	REQUIRE(pts.size() == 5);
	CHECK(pts.front().IsEqual({0, 0}, 1e-12));
	CHECK(pts.back().IsEqual({2, 0}, 1e-12));
	// apex of a symmetric curve is halfway to the control point
	CHECK(pts[2].X() == Approx(1));
	CHECK(pts[2].Y() == Approx(1));
}

TEST_CASE("buffer_path on a straight line") {
	using Catch::Approx;

	const double length = 10, w = 1.5;

	for (int k : {4, 8, 64}) {
		const auto outline = buffer_path({{0, 0}, {length, 0}}, w, k);

		// two offset points per end plus k-1 interior points per cap
		REQUIRE(outline.size() == 4 + 2 * (size_t)(k - 1));

		// rectangle plus two caps, each a fan of k triangles
		const double expected = length * 2 * w + k * w * w * std::sin(M_PI / k);
		CHECK(std::abs(signed_area(outline)) == Approx(expected));
	}

	SECTION("caps converge on a circle") {
		const auto outline = buffer_path({{0, 0}, {length, 0}}, w, 256);
		CHECK(std::abs(signed_area(outline)) == Approx(length * 2 * w + M_PI * w * w).epsilon(1e-4));
	}
}

TEST_CASE("buffer_path edge cases") {
	SECTION("repeated points are skipped") {
		const auto a = buffer_path({{0, 0}, {0, 0}, {5, 0}, {5, 0}}, 1, 8);
		const auto b = buffer_path({{0, 0}, {5, 0}}, 1, 8);
		CHECK(a.size() == b.size());
		CHECK(signed_area(a) == Catch::Approx(signed_area(b)));
	}
	SECTION("nothing to stroke") {
		CHECK(buffer_path({{1, 1}}, 1).empty());
		CHECK(buffer_path({{1, 1}, {1, 1}}, 1).empty());
		CHECK(buffer_path({{0, 0}, {1, 1}}, 0).empty());
	}
	SECTION("outline stays within half_width of the line") {
		const auto outline = buffer_path({{0, 0}, {3, 1}, {6, 0}}, 0.5, 8);
		for (const auto &p : outline) {
			CHECK(p.Y() <= 1.5 + 1e-9);
			CHECK(p.Y() >= -0.5 - 1e-9);
		}
	}
}
#endif
