#include <sstream>

#ifdef INCLUDE_TESTS
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#endif

#include <BRepBuilderAPI_Copy.hxx>
#include <BRepBuilderAPI_Transform.hxx>
#include <BRepPrimAPI_MakePrism.hxx>
#include <gp_Vec.hxx>

#include <aixlog.hpp>

#include "errors.hpp"
#include "geometry.hpp"
#include "relief_assembler.hpp"


TopoDS_Shape
extrude_layer(const TopoDS_Shape &shape, double depth)
{
	if (shape.IsNull()) {
		throw relief_error("nothing to extrude");
	}

	BRepPrimAPI_MakePrism prism{shape, gp_Vec(0, 0, depth)};
	if (!prism.IsDone()) {
		std::stringstream msg;
		msg << "unable to extrude layer by " << depth << "mm";
		throw relief_error(msg.str());
	}
	return prism.Shape();
}

TopoDS_Shape
place_on_frame(const TopoDS_Shape &solid, const plane_frame &frame, relief_mode mode)
{
	BRepBuilderAPI_Transform placed{solid, frame_placement(frame, mode), true};
	if (!placed.IsDone()) {
		throw relief_error("unable to place relief on face");
	}
	return placed.Shape();
}

TopoDS_Shape
combine_with_base(
	const TopoDS_Shape &base, const std::vector<TopoDS_Shape> &placed, relief_mode mode)
{
	const auto op = mode == relief_mode::emboss ? BOPAlgo_FUSE : BOPAlgo_CUT;

	TopoDS_Shape result = BRepBuilderAPI_Copy(base).Shape();
	for (size_t i = 0; i < placed.size(); i++) {
		std::stringstream what;
		what << "relief step " << i + 1 << " of " << placed.size();
		result = perform_boolean(op, result, placed[i], what.str().c_str());
	}

	return result;
}

TopoDS_Shape
assemble_relief(
	const TopoDS_Shape &base, const plane_frame &frame, relief_mode mode,
	const std::vector<relief_layer> &layers)
{
	std::vector<TopoDS_Shape> placed;
	for (const auto &layer : layers) {
		if (layer.depth < min_layer_depth) {
			LOG(DEBUG) << "skipping layer " << layer.name << ", depth " << layer.depth << "mm\n";
			continue;
		}
		LOG(DEBUG) << "extruding layer " << layer.name << " to " << layer.depth << "mm\n";
		placed.push_back(place_on_frame(extrude_layer(layer.shape, layer.depth), frame, mode));
	}

	if (placed.empty()) {
		LOG(WARNING) << "every layer is too shallow, result is a copy of the input\n";
	}

	return combine_with_base(base, placed, mode);
}

#ifdef INCLUDE_TESTS
#include <stdexcept>

#include <BRepPrimAPI_MakeBox.hxx>
#include <TopExp_Explorer.hxx>
#include <TopoDS.hxx>

#include "shape2d.hpp"

static plane_frame
top_frame_of(const TopoDS_Shape &shape)
{
	for (TopExp_Explorer ex{shape, TopAbs_FACE}; ex.More(); ex.Next()) {
		const auto frame = extract_plane_frame(TopoDS::Face(ex.Current()));
		if (frame.normal.IsEqual(gp_Dir(0, 0, 1), 1e-9)) {
			return frame;
		}
	}
	throw std::logic_error("shape has no top face");
}

TEST_CASE("assemble_relief") {
	using Catch::Approx;

	const auto box = BRepPrimAPI_MakeBox(gp_Pnt(0, 0, 0), 50, 50, 50).Shape();
	const auto frame = top_frame_of(box);
	const double box_volume = 50 * 50 * 50;

	const auto outer = make_polygon_face({{-5, -5}, {5, -5}, {5, 5}, {-5, 5}});
	const auto inner = make_polygon_face({{-2, -2}, {2, -2}, {2, 2}, {-2, 2}});
	const auto layers = isolate_layers({
		{"inner", inner, 2.0, 0},
		{"outer", outer, 1.0, 1},
	});
	const double relief_volume = (100 - 16) * 1.0 + 16 * 2.0;

	SECTION("deboss cuts every layer to its own depth") {
		const auto res = assemble_relief(box, frame, relief_mode::deboss, layers);
		CHECK(volume_of_shape(res) == Approx(box_volume - relief_volume));
		CHECK(volume_of_shape(box) == Approx(box_volume));
		CHECK(is_shape_valid("deboss", res));
	}

	SECTION("emboss stands proud of the face") {
		const auto res = assemble_relief(box, frame, relief_mode::emboss, layers);
		CHECK(volume_of_shape(res) == Approx(box_volume + relief_volume));
	}

	SECTION("shallow layers are skipped") {
		const auto res = assemble_relief(box, frame, relief_mode::deboss, {
			{"outer", outer, 1e-5, 0},
		});
		CHECK(volume_of_shape(res) == Approx(box_volume));
	}

	SECTION("off the face misses the body") {
		const auto away = make_plane_frame(frame.origin, frame.normal, 100, 0);
		const auto res = assemble_relief(box, away, relief_mode::deboss, layers);
		CHECK(volume_of_shape(res) == Approx(box_volume));
	}
}
#endif
