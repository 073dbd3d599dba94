#include <sstream>

#ifdef INCLUDE_TESTS
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#endif

#include <BOPAlgo_Operation.hxx>

#include <TopAbs_ShapeEnum.hxx>
#include <TopExp_Explorer.hxx>
#include <TopoDS_Iterator.hxx>

#include <BRepCheck_Analyzer.hxx>

#include <BRepGProp.hxx>
#include <GProp_GProps.hxx>

#include <Message_Report.hxx>
#include <Message_Gravity.hxx>

#include <aixlog.hpp>

#include "errors.hpp"
#include "geometry.hpp"


std::ostream&
operator<<(std::ostream& str, TopAbs_ShapeEnum type)
{
	const char* name = "unknown";
	switch(type) {
	case TopAbs_COMPOUND: name = "COMPOUND"; break;
	case TopAbs_COMPSOLID: name = "COMPSOLID"; break;
	case TopAbs_SOLID: name = "SOLID"; break;
	case TopAbs_SHELL: name = "SHELL"; break;
	case TopAbs_FACE: name = "FACE"; break;
	case TopAbs_WIRE: name = "WIRE"; break;
	case TopAbs_EDGE: name = "EDGE"; break;
	case TopAbs_VERTEX: name = "VERTEX"; break;
	case TopAbs_SHAPE: name = "SHAPE"; break;
	}
	return str << name;
}

std::ostream&
operator<<(std::ostream& str, BRepCheck_Status status)
{
	const char* name = "unknown";
	switch(status)
	{
	case BRepCheck_NoError: name = "NoError"; break;
	case BRepCheck_InvalidPointOnCurve: name = "InvalidPointOnCurve"; break;
	case BRepCheck_InvalidPointOnCurveOnSurface: name = "InvalidPointOnCurveOnSurface"; break;
	case BRepCheck_InvalidPointOnSurface: name = "InvalidPointOnSurface"; break;
	case BRepCheck_No3DCurve: name = "No3DCurve"; break;
	case BRepCheck_Multiple3DCurve: name = "Multiple3DCurve"; break;
	case BRepCheck_Invalid3DCurve: name = "Invalid3DCurve"; break;
	case BRepCheck_NoCurveOnSurface: name = "NoCurveOnSurface"; break;
	case BRepCheck_InvalidCurveOnSurface: name = "InvalidCurveOnSurface"; break;
	case BRepCheck_InvalidCurveOnClosedSurface: name = "InvalidCurveOnClosedSurface"; break;
	case BRepCheck_InvalidSameRangeFlag: name = "InvalidSameRangeFlag"; break;
	case BRepCheck_InvalidSameParameterFlag: name = "InvalidSameParameterFlag"; break;
	case BRepCheck_InvalidDegeneratedFlag: name = "InvalidDegeneratedFlag"; break;
	case BRepCheck_FreeEdge: name = "FreeEdge"; break;
	case BRepCheck_InvalidMultiConnexity: name = "InvalidMultiConnexity"; break;
	case BRepCheck_InvalidRange: name = "InvalidRange"; break;
	case BRepCheck_EmptyWire: name = "EmptyWire"; break;
	case BRepCheck_RedundantEdge: name = "RedundantEdge"; break;
	case BRepCheck_SelfIntersectingWire: name = "SelfIntersectingWire"; break;
	case BRepCheck_NoSurface: name = "NoSurface"; break;
	case BRepCheck_InvalidWire: name = "InvalidWire"; break;
	case BRepCheck_RedundantWire: name = "RedundantWire"; break;
	case BRepCheck_IntersectingWires: name = "IntersectingWires"; break;
	case BRepCheck_InvalidImbricationOfWires: name = "InvalidImbricationOfWires"; break;
	case BRepCheck_EmptyShell: name = "EmptyShell"; break;
	case BRepCheck_RedundantFace: name = "RedundantFace"; break;
	case BRepCheck_InvalidImbricationOfShells: name = "InvalidImbricationOfShells"; break;
	case BRepCheck_UnorientableShape: name = "UnorientableShape"; break;
	case BRepCheck_NotClosed: name = "NotClosed"; break;
	case BRepCheck_NotConnected: name = "NotConnected"; break;
	case BRepCheck_SubshapeNotInShape: name = "SubshapeNotInShape"; break;
	case BRepCheck_BadOrientation: name = "BadOrientation"; break;
	case BRepCheck_BadOrientationOfSubshape: name = "BadOrientationOfSubshape"; break;
	case BRepCheck_InvalidPolygonOnTriangulation: name = "InvalidPolygonOnTriangulation"; break;
	case BRepCheck_InvalidToleranceValue: name = "InvalidToleranceValue"; break;
	case BRepCheck_EnclosedRegion: name = "EnclosedRegion"; break;
	case BRepCheck_CheckFail: name = "CheckFail"; break;
	}
	return str << name;
}

std::ostream&
operator<<(std::ostream& str, BOPAlgo_Operation op)
{
	const char* name = "unknown";
	switch(op) {
	case BOPAlgo_COMMON: name = "common"; break;
	case BOPAlgo_FUSE: name = "fuse"; break;
	case BOPAlgo_CUT: name = "cut"; break;
	case BOPAlgo_CUT21: name = "cut21"; break;
	case BOPAlgo_SECTION: name = "section"; break;
	case BOPAlgo_UNKNOWN: break;
	}
	return str << name;
}

double
volume_of_shape(const TopoDS_Shape& shape)
{
	GProp_GProps props;
	BRepGProp::VolumeProperties(shape, props);
	const double volume = props.Mass();
	if (volume < 0) {
		throw relief_error("volume of shape less than zero");
	}
	return volume;
}

double
area_of_shape(const TopoDS_Shape& shape)
{
	GProp_GProps props;
	BRepGProp::SurfaceProperties(shape, props);
	return props.Mass();
}

bool
shape_has_solids(const TopoDS_Shape& shape)
{
	TopExp_Explorer ex{shape, TopAbs_SOLID};
	return ex.More();
}

bool
is_shape_valid(const char *label, const TopoDS_Shape& shape)
{
	BRepCheck_Analyzer checker{shape};
	if (checker.IsValid()) {
		return true;
	}

	LOG(WARNING)
		<< label
		<< " contains following errors ";

	for (const auto status : checker.Result(shape)->Status()) {
		if (status != BRepCheck_NoError) {
			LOG(WARNING) << status << ' ';
		}
	}

	for (TopoDS_Iterator it{shape}; it.More(); it.Next()) {
		const auto &component = it.Value();

		if (checker.IsValid(component)) {
			continue;
		}

		for (const auto status : checker.Result(component)->Status()) {
			if (status != BRepCheck_NoError) {
				LOG(WARNING) << status << ' ';
			}
		}
	}

	LOG(WARNING) << '\n';

	return false;
}

static inline int
count_warnings(const Message_Report *report)
{
	if (report) {
		return report->GetAlerts(Message_Warning).Size();
	}
	return 0;
}

TopoDS_Shape
perform_boolean(
	BOPAlgo_Operation op,
	const TopoDS_Shape& shape, const TopoDS_Shape& tool,
	const char *what)
{
	if (shape.IsNull() || tool.IsNull()) {
		std::stringstream msg;
		msg << what << ": " << op << " given a null shape";
		throw boolean_operation_failed(msg.str());
	}

	boolean_op bop{op, shape, tool};
	bop.Build();

	const int num_warnings = count_warnings(bop.GetReport().get());
	if (num_warnings > 0) {
		LOG(DEBUG) << what << ": " << op << " produced " << num_warnings << " warnings\n";
	}

	if (bop.HasErrors() || !bop.IsDone()) {
		std::stringstream msg;
		msg << what << ": " << op << " failed";
		std::stringstream alerts;
		bop.DumpErrors(alerts);
		if (!alerts.str().empty()) {
			msg << ", " << alerts.str();
		}
		throw boolean_operation_failed(msg.str());
	}

	return bop.Shape();
}

#ifdef INCLUDE_TESTS
#include <BRepPrimAPI_MakeBox.hxx>

static inline TopoDS_Shape
cube_at(double x, double y, double z, double length)
{
	return BRepPrimAPI_MakeBox(gp_Pnt(x, y, z), length, length, length).Shape();
}

TEST_CASE("perform_boolean") {
	using Catch::Approx;

	SECTION("cut removes the common volume") {
		const auto s1 = cube_at(0, 0, 0, 10), s2 = cube_at(5, 0, 0, 10);

		const auto res = perform_boolean(BOPAlgo_CUT, s1, s2, "test");

		CHECK(volume_of_shape(res) == Approx(5*10*10));
		CHECK(volume_of_shape(s1) == Approx(10*10*10));
	}

	SECTION("fuse of touching cubes") {
		const auto s1 = cube_at(0, 0, 0, 5), s2 = cube_at(5, 0, 0, 5);

		const auto res = perform_boolean(BOPAlgo_FUSE, s1, s2, "test");

		CHECK(volume_of_shape(res) == Approx(2*5*5*5));
	}

	SECTION("common of distinct cubes is empty") {
		const auto s1 = cube_at(0, 0, 0, 4), s2 = cube_at(5, 5, 5, 4);

		const auto res = perform_boolean(BOPAlgo_COMMON, s1, s2, "test");

		CHECK_FALSE(shape_has_solids(res));
	}

	SECTION("null shapes are rejected") {
		CHECK_THROWS_AS(
			perform_boolean(BOPAlgo_CUT, cube_at(0, 0, 0, 1), TopoDS_Shape{}, "test"),
			boolean_operation_failed);
	}
}

TEST_CASE("area_of_shape") {
	using Catch::Approx;

	CHECK(area_of_shape(cube_at(0, 0, 0, 2)) == Approx(6*2*2));
	CHECK(is_shape_valid("cube", cube_at(0, 0, 0, 2)));
}

TEST_CASE("volume_of_shape") {
	using Catch::Approx;

	const auto cube = cube_at(0, 0, 0, 3);
	CHECK(volume_of_shape(cube) == Approx(27));

	// inside out solids have negative volume
	CHECK_THROWS_AS(volume_of_shape(cube.Reversed()), relief_error);
}
#endif
