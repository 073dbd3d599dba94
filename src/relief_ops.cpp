#include <algorithm>
#include <sstream>
#include <vector>

#ifdef INCLUDE_TESTS
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#endif

#include <aixlog.hpp>

#include "errors.hpp"
#include "geometry.hpp"
#include "layer_isolator.hpp"
#include "logo_shapes.hpp"
#include "plane_frame.hpp"
#include "relief_assembler.hpp"
#include "relief_ops.hpp"


relief_config
default_relief_config()
{
	relief_config config;
	config.qr_source = libqrencode_module_source();
	return config;
}

static void
warn_if_deeper_than_background(const char *name, double depth, double background)
{
	if (depth > background) {
		LOG(WARNING)
			<< name << " depth " << depth << "mm is deeper than the circle ("
			<< background << "mm), it will cut through the background\n";
	}
}

// background first, the order the artwork is drawn
static std::vector<relief_layer>
logo_layers(const logo_shapes &shapes, const logo_params &p)
{
	const double
		mountain_depth = p.total_depth * p.mountain_ratio,
		trail_depth = p.total_depth * p.trail_ratio,
		bolt_depth = p.total_depth * p.bolt_ratio;

	warn_if_deeper_than_background("mountain", mountain_depth, p.total_depth);
	warn_if_deeper_than_background("trail", trail_depth, p.total_depth);
	warn_if_deeper_than_background("bolt", bolt_depth, p.total_depth);

	auto layers = isolate_layers({
		{"circle", shapes.circle, p.total_depth, 3},
		{"mountain", shapes.mountain, mountain_depth, 2},
		{"trail", shapes.trail, trail_depth, 1},
		{"bolt", shapes.bolt, bolt_depth, 0},
	});

	std::reverse(layers.begin(), layers.end());
	return layers;
}

static void
log_volume_change(const char *what, const TopoDS_Shape &before, const TopoDS_Shape &after)
{
	LOG(INFO)
		<< what << " changed volume by "
		<< volume_of_shape(after) - volume_of_shape(before) << "mm^3\n";
}

TopoDS_Shape
apply_logo(
	const TopoDS_Shape &base, const TopoDS_Face &face, const logo_params &params)
{
	const auto frame = extract_plane_frame(
		face, params.x_offset, params.y_offset, params.rotation);

	const auto shapes = create_logo_shapes(params.diameter);
	const auto layers = logo_layers(shapes, params);

	const auto result = assemble_relief(base, frame, relief_mode::deboss, layers);
	log_volume_change("logo deboss", base, result);
	return result;
}

TopoDS_Shape
apply_logotext(
	const TopoDS_Shape &base, const TopoDS_Face &face, const logotext_params &params)
{
	const auto &logo = params.logo;
	const auto frame = extract_plane_frame(
		face, logo.x_offset, logo.y_offset, logo.rotation);

	const auto shapes = create_logotext_shapes(logo.diameter, params.text);
	auto layers = logo_layers(shapes.logo, logo);

	// text sits beside the circle, there's nothing to isolate it from
	const double text_depth = logo.total_depth * params.text_ratio;
	layers.push_back({"text", shapes.text, text_depth, 4});

	const auto result = assemble_relief(base, frame, relief_mode::deboss, layers);
	log_volume_change("logo and text deboss", base, result);
	return result;
}

qr_result
apply_qr(
	const relief_config &config,
	const TopoDS_Shape &base, const TopoDS_Face &face, const qr_params &params)
{
	if (!config.qr_source) {
		throw missing_dependency(
			"no QR encoder available, install libqrencode (e.g. libqrencode-dev) and rebuild");
	}

	const auto frame = extract_plane_frame(face, params.x_offset, params.y_offset);
	const auto mode = params.emboss ? relief_mode::emboss : relief_mode::deboss;

	const auto level = parse_error_correction(params.error_correction);
	const auto matrix = config.qr_source(params.url, level, params.border);
	if (matrix.size() == 0 || matrix.count_dark() == 0) {
		throw empty_matrix("QR encoding of '" + params.url + "' has no dark modules");
	}

	qr_result res;
	res.modules = matrix.size();
	res.module_size_mm = params.size / res.modules;
	res.version = qr_version_of(matrix, params.border);

	LOG(INFO)
		<< "QR version " << res.version << ", " << res.modules << "x" << res.modules
		<< " modules, " << res.module_size_mm << "mm each\n";
	if (res.module_size_mm < qr_min_module_size) {
		LOG(WARNING)
			<< "QR modules are " << res.module_size_mm
			<< "mm, may be too small to print or scan, increase the size\n";
	}

	const auto solid = make_qr_solid(matrix, params.size, params.height);
	if (!solid) {
		throw empty_matrix("QR matrix has no dark modules");
	}

	res.shape = combine_with_base(base, {place_on_frame(*solid, frame, mode)}, mode);
	log_volume_change(params.emboss ? "QR emboss" : "QR deboss", base, res.shape);
	return res;
}

namespace {
struct record_applier {
	const relief_config &config;
	const TopoDS_Shape &base;
	const TopoDS_Face &face;

	TopoDS_Shape operator()(const logo_params &p) const {
		return apply_logo(base, face, p);
	}
	TopoDS_Shape operator()(const logotext_params &p) const {
		return apply_logotext(base, face, p);
	}
	TopoDS_Shape operator()(const qr_params &p) const {
		return apply_qr(config, base, face, p).shape;
	}
};
}

TopoDS_Shape
apply_record(
	const relief_config &config, const document &doc, const relief_record &record)
{
	LOG(INFO)
		<< "reapplying " << record_kind(record) << " relief to "
		<< record.face_id << " of " << record.body_id << '\n';

	const auto face = doc.face(record.face_id);
	return std::visit(record_applier{config, doc.shape, face}, record.params);
}

#ifdef INCLUDE_TESTS
#include <stdexcept>

#include <BRepAdaptor_Surface.hxx>
#include <BRepPrimAPI_MakeBox.hxx>
#include <BRepPrimAPI_MakeCylinder.hxx>
#include <TopExp.hxx>
#include <TopExp_Explorer.hxx>
#include <TopTools_IndexedMapOfShape.hxx>
#include <TopoDS.hxx>

// face of shape whose outward normal is +Z
static TopoDS_Face
top_face_of(const TopoDS_Shape &shape)
{
	for (TopExp_Explorer ex{shape, TopAbs_FACE}; ex.More(); ex.Next()) {
		const auto &face = TopoDS::Face(ex.Current());
		if (extract_plane_frame(face).normal.IsEqual(gp_Dir(0, 0, 1), 1e-9)) {
			return face;
		}
	}
	throw std::logic_error("shape has no top face");
}

static int
count_faces(const TopoDS_Shape &shape)
{
	TopTools_IndexedMapOfShape faces;
	TopExp::MapShapes(shape, TopAbs_FACE, faces);
	return faces.Extent();
}

TEST_CASE("apply_logo on a cube") {
	using Catch::Approx;

	const auto cube = BRepPrimAPI_MakeBox(gp_Pnt(-25, -25, -25), 50, 50, 50).Shape();
	const auto top = top_face_of(cube);
	const double cube_volume = 50 * 50 * 50;

	logo_params p;
	p.diameter = 18;
	p.total_depth = 0.8;

	const auto res = apply_logo(cube, top, p);

	const double removed = cube_volume - volume_of_shape(res);
	CHECK(removed > 0);
	CHECK(removed < M_PI * 9 * 9 * 0.8);
	CHECK(is_shape_valid("logo", res));

	// the base is untouched
	CHECK(volume_of_shape(cube) == Approx(cube_volume));

	SECTION("circle sets the deepest point") {
		// a box just below the deepest layer sees no change
		const auto below = BRepPrimAPI_MakeBox(gp_Pnt(-25, -25, -25), 50, 50, 50 - 0.8 - 1e-3).Shape();
		const auto kept = perform_boolean(BOPAlgo_COMMON, res, below, "test");
		CHECK(volume_of_shape(kept) == Approx(volume_of_shape(below)));
	}

	SECTION("zero depth does nothing") {
		p.total_depth = 0;
		CHECK(volume_of_shape(apply_logo(cube, top, p)) == Approx(cube_volume));
	}

	SECTION("curved faces are rejected before building anything") {
		const auto cyl = BRepPrimAPI_MakeCylinder(10, 10).Shape();
		for (TopExp_Explorer ex{cyl, TopAbs_FACE}; ex.More(); ex.Next()) {
			const auto &face = TopoDS::Face(ex.Current());
			if (BRepAdaptor_Surface(face).GetType() != GeomAbs_Plane) {
				CHECK_THROWS_AS(apply_logo(cyl, face, p), non_planar_face);
			}
		}
	}
}

TEST_CASE("apply_logotext") {
	using Catch::Approx;

	// local X of the top face runs along world +Y, the bar is long enough
	// for the text beside the logo
	const auto bar = BRepPrimAPI_MakeBox(gp_Pnt(-15, -20, -5), 30, 110, 5).Shape();
	const auto top = top_face_of(bar);
	REQUIRE(extract_plane_frame(top).u_axis.IsEqual(gp_Dir(0, 1, 0), 1e-9));

	logotext_params p;
	p.logo.x_offset = -30;

	const auto logo_only = apply_logo(bar, top, p.logo);
	const auto with_text = apply_logotext(bar, top, p);

	CHECK(volume_of_shape(with_text) < volume_of_shape(logo_only));

	SECTION("unsupported text fails without a result") {
		p.text = "TrailZ";
		CHECK_THROWS_AS(apply_logotext(bar, top, p), unsupported_character);
	}
}

TEST_CASE("apply_qr") {
	using Catch::Approx;

	const auto plate = BRepPrimAPI_MakeBox(gp_Pnt(-20, -20, -5), 40, 40, 5).Shape();
	const auto top = top_face_of(plate);
	const double plate_volume = 40 * 40 * 5;

	qr_params p;
	p.url = "https://example.com";
	p.size = 20;
	p.height = 0.5;
	p.emboss = false;
	p.error_correction = "M";
	p.border = 2;

	const auto config = default_relief_config();

	SECTION("deboss") {
		const auto res = apply_qr(config, plate, top, p);

		const auto matrix = config.qr_source(p.url, qr_error_correction::medium, p.border);
		CHECK(res.modules == matrix.size());
		CHECK(res.module_size_mm == Approx(20. / matrix.size()));
		CHECK(volume_of_shape(res.shape) < plate_volume);

		const double ms = res.module_size_mm;
		CHECK(plate_volume - volume_of_shape(res.shape) ==
			Approx(matrix.count_dark() * ms * ms * (p.height + 0.01)));
	}

	SECTION("emboss adds volume") {
		p.emboss = true;
		const auto res = apply_qr(config, plate, top, p);
		CHECK(volume_of_shape(res.shape) > plate_volume);
	}

	SECTION("blank matrices are an error") {
		relief_config blank;
		blank.qr_source = [](const std::string &, qr_error_correction, int border) {
			return qr_module_matrix{21 + 2 * border};
		};
		CHECK_THROWS_AS(apply_qr(blank, plate, top, p), empty_matrix);
	}

	SECTION("no encoder") {
		CHECK_THROWS_AS(apply_qr(relief_config{}, plate, top, p), missing_dependency);
	}
}

TEST_CASE("apply_record reproduces the result") {
	using Catch::Approx;

	document doc;
	doc.set_shape(BRepPrimAPI_MakeBox(gp_Pnt(-25, -25, -25), 50, 50, 50).Shape());
	doc.body_id = "cube.brep";

	const auto top = top_face_of(doc.shape);
	const int idx = doc.faces.FindIndex(top);
	REQUIRE(idx > 0);

	logo_params p;
	p.rotation = 30;
	p.x_offset = 2;
	const auto first = apply_logo(doc.shape, top, p);

	std::stringstream ss;
	write_relief_record(ss, {p, doc.body_id, document::face_name(idx)});
	const auto again = apply_record(default_relief_config(), doc, read_relief_record(ss));

	CHECK(volume_of_shape(again) == Approx(volume_of_shape(first)));
	CHECK(count_faces(again) == count_faces(first));
}
#endif
