#include <string>

#ifdef INCLUDE_TESTS
#include <cmath>
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#endif

#include <BRepBndLib.hxx>
#include <BRepBuilderAPI_MakeEdge.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepBuilderAPI_MakeWire.hxx>
#include <BRepBuilderAPI_Transform.hxx>
#include <Bnd_Box.hxx>
#include <gp_Ax2.hxx>
#include <gp_Circ.hxx>
#include <gp_Pnt.hxx>
#include <gp_Trsf.hxx>
#include <gp_Vec.hxx>

#include "errors.hpp"
#include "geometry.hpp"
#include "shape2d.hpp"


double
signed_area(const polygon2d &poly)
{
	double sum = 0;
	const size_t n = poly.size();
	for (size_t i = 0; i < n; i++) {
		const auto &a = poly[i], &b = poly[(i + 1) % n];
		sum += a.X() * b.Y() - b.X() * a.Y();
	}
	return sum / 2;
}

TopoDS_Face
make_polygon_face(const polygon2d &poly)
{
	if (poly.size() < 3) {
		throw relief_error("polygon needs at least three points");
	}

	// clockwise outlines would give a face looking down -Z
	const bool reverse = signed_area(poly) < 0;

	BRepBuilderAPI_MakePolygon wire;
	for (size_t i = 0; i < poly.size(); i++) {
		const auto &p = reverse ? poly[poly.size() - 1 - i] : poly[i];
		wire.Add(gp_Pnt(p.X(), p.Y(), 0));
	}
	wire.Close();
	if (!wire.IsDone()) {
		throw relief_error("unable to build polygon wire");
	}

	BRepBuilderAPI_MakeFace face{wire.Wire(), true};
	if (!face.IsDone()) {
		throw relief_error("unable to build face from polygon");
	}
	return face.Face();
}

TopoDS_Face
make_disc_face(double diameter)
{
	if (!(diameter > 0)) {
		throw invalid_parameter("disc diameter must be positive");
	}

	const gp_Circ circ{gp_Ax2(gp_Pnt(0, 0, 0), gp_Dir(0, 0, 1)), diameter / 2};
	BRepBuilderAPI_MakeWire wire{BRepBuilderAPI_MakeEdge(circ).Edge()};

	BRepBuilderAPI_MakeFace face{wire.Wire(), true};
	if (!face.IsDone()) {
		throw relief_error("unable to build disc face");
	}
	return face.Face();
}

TopoDS_Shape
translate_shape(const TopoDS_Shape &shape, double dx, double dy)
{
	gp_Trsf trsf;
	trsf.SetTranslation(gp_Vec(dx, dy, 0));
	return BRepBuilderAPI_Transform(shape, trsf, true).Shape();
}

TopoDS_Shape
fuse_all(const std::vector<TopoDS_Shape> &shapes, const char *what)
{
	if (shapes.empty()) {
		throw invalid_parameter(std::string("no shapes to fuse for ") + what);
	}

	TopoDS_Shape result = shapes.front();
	for (size_t i = 1; i < shapes.size(); i++) {
		result = perform_boolean(BOPAlgo_FUSE, result, shapes[i], what);
	}
	return result;
}

bounds2d
shape_bounds(const TopoDS_Shape &shape)
{
	Bnd_Box box;
	BRepBndLib::Add(shape, box, false);
	if (box.IsVoid()) {
		throw relief_error("shape has no extent");
	}

	double xmin, ymin, zmin, xmax, ymax, zmax;
	box.Get(xmin, ymin, zmin, xmax, ymax, zmax);

	return {xmin, ymin, xmax, ymax};
}

#ifdef INCLUDE_TESTS
TEST_CASE("polygon faces") {
	using Catch::Approx;

	const polygon2d square{{0, 0}, {2, 0}, {2, 2}, {0, 2}};
	const polygon2d clockwise{{0, 0}, {0, 2}, {2, 2}, {2, 0}};

	CHECK(signed_area(square) == Approx(4));
	CHECK(signed_area(clockwise) == Approx(-4));

	SECTION("both windings give the same +Z face") {
		CHECK(area_of_shape(make_polygon_face(square)) == Approx(4));
		CHECK(area_of_shape(make_polygon_face(clockwise)) == Approx(4));
	}

	SECTION("degenerate polygons are rejected") {
		CHECK_THROWS_AS(make_polygon_face({{0, 0}, {1, 1}}), relief_error);
	}
}

TEST_CASE("disc and translation") {
	using Catch::Approx;

	const auto disc = make_disc_face(10);
	CHECK(area_of_shape(disc) == Approx(M_PI * 25));

	const auto b = shape_bounds(translate_shape(disc, 3, -1));
	CHECK(b.xmin == Approx(-2).margin(1e-5));
	CHECK(b.xmax == Approx(8).margin(1e-5));
	CHECK(b.ymin == Approx(-6).margin(1e-5));
	CHECK(b.ymax == Approx(4).margin(1e-5));

	CHECK_THROWS_AS(make_disc_face(0), invalid_parameter);
}

TEST_CASE("fuse_all") {
	using Catch::Approx;

	const auto a = make_polygon_face({{0, 0}, {2, 0}, {2, 2}, {0, 2}});
	const auto b = make_polygon_face({{1, 0}, {3, 0}, {3, 2}, {1, 2}});

	CHECK(area_of_shape(fuse_all({a, b}, "test")) == Approx(6));
	CHECK_THROWS_AS(fuse_all({}, "test"), invalid_parameter);
}
#endif
