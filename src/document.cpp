#include <cctype>
#include <cstring>
#include <filesystem>
#include <sstream>

#ifdef INCLUDE_TESTS
#include <fstream>
#include <catch2/catch_test_macros.hpp>
#endif

#include <TopAbs_ShapeEnum.hxx>
#include <TopExp.hxx>
#include <TopoDS.hxx>

#include <BRepTools.hxx>
#include <BRep_Builder.hxx>

#include <RWStl.hxx>

#include <aixlog.hpp>

#include "document.hpp"
#include "errors.hpp"
#include "geometry.hpp"
#include "utils.hpp"


static bool
has_extension(const std::string &path, const char *ext)
{
	const size_t n = std::strlen(ext);
	if (path.size() < n) {
		return false;
	}
	for (size_t i = 0; i < n; i++) {
		if (std::tolower((unsigned char)path[path.size() - n + i]) != ext[i]) {
			return false;
		}
	}
	return true;
}

void
document::load_brep_file(const char* path)
{
	BRep_Builder builder;
	TopoDS_Shape loaded;

	LOG(DEBUG) << "reading brep file " << path << '\n';

	if (!BRepTools::Read(loaded, path, builder) || loaded.IsNull()) {
		throw relief_error(std::string("unable to read BREP file ") + path);
	}

	switch(loaded.ShapeType()) {
	case TopAbs_COMPOUND:
	case TopAbs_COMPSOLID:
	case TopAbs_SOLID:
		break;

	default:
		std::stringstream msg;
		msg << "expected SOLID, COMPSOLID or COMPOUND toplevel shape in " << path
			<< ", not " << loaded.ShapeType();
		throw relief_error(msg.str());
	}

	if (!shape_has_solids(loaded)) {
		throw relief_error(std::string("brep file ") + path + " does not contain any solids");
	}

	// records hold the absolute path
	body_id = std::filesystem::absolute(path).string();
	set_shape(loaded);

	LOG(DEBUG) << "loaded body with " << faces.Extent() << " faces\n";
}

void
document::write_brep_file(const char* path) const
{
	LOG(DEBUG) << "writing brep file " << path << '\n';

	if (!BRepTools::Write(shape, path)) {
		throw relief_error(std::string("failed to write BREP file ") + path);
	}
}

void
document::set_shape(const TopoDS_Shape &s)
{
	shape = s;
	faces.Clear();
	TopExp::MapShapes(shape, TopAbs_FACE, faces);
}

int
document::lookup_face(const std::string &str) const
{
	const char *digits = str.c_str();
	if (str.compare(0, 4, "Face") == 0) {
		digits += 4;
	}

	int idx = 0;
	if (!int_of_string(digits, idx, 10)) {
		return 0;
	}
	if (idx < 1 || idx > faces.Extent()) {
		return 0;
	}
	return idx;
}

TopoDS_Face
document::face(const std::string &str) const
{
	const int idx = lookup_face(str);
	if (idx == 0) {
		std::stringstream msg;
		msg << "face '" << str << "' not found, body has " << faces.Extent() << " faces";
		throw invalid_parameter(msg.str());
	}
	return TopoDS::Face(faces.FindKey(idx));
}

std::string
document::face_name(int index)
{
	return "Face" + std::to_string(index);
}

input_model
load_input_model(const std::string &path)
{
	input_model model{false, false, {}, {}};

	if (has_extension(path, ".stl")) {
		LOG(DEBUG) << "reading stl file " << path << '\n';

		model.mesh = RWStl::ReadFile(path.c_str());
		if (model.mesh.IsNull() || model.mesh->NbTriangles() == 0) {
			throw relief_error("unable to read STL file " + path);
		}
		model.has_mesh = true;

		LOG(DEBUG) << "mesh has " << model.mesh->NbTriangles() << " triangles\n";
		return model;
	}

	document doc;
	doc.load_brep_file(path.c_str());
	model.shape = doc.shape;
	model.has_solid_shape = true;

	return model;
}

#ifdef INCLUDE_TESTS
#include <BRepPrimAPI_MakeBox.hxx>

TEST_CASE("document face lookup") {
	document doc;
	doc.set_shape(BRepPrimAPI_MakeBox(10, 10, 10).Shape());

	REQUIRE(doc.faces.Extent() == 6);

	SECTION("valid names") {
		CHECK(doc.lookup_face("Face1") == 1);
		CHECK(doc.lookup_face("Face6") == 6);
		CHECK(doc.lookup_face("3") == 3);
		CHECK(document::face_name(4) == "Face4");
	}
	SECTION("invalid names") {
		CHECK(doc.lookup_face("Face0") == 0);
		CHECK(doc.lookup_face("Face7") == 0);
		CHECK(doc.lookup_face("Edge1") == 0);
		CHECK(doc.lookup_face("Face") == 0);
		CHECK(doc.lookup_face("0x2") == 0);
		CHECK_THROWS_AS(doc.face("Face9"), invalid_parameter);
	}
}

TEST_CASE("load_input_model") {
	const auto dir = std::filesystem::temp_directory_path();
	const auto brep = (dir / "face_relief_box_test.brep").string();

	document out;
	out.set_shape(BRepPrimAPI_MakeBox(10, 10, 10).Shape());
	out.write_brep_file(brep.c_str());

	const auto model = load_input_model(brep);
	CHECK(model.has_solid_shape);
	CHECK_FALSE(model.has_mesh);
	CHECK(shape_has_solids(model.shape));

	CHECK_THROWS_AS(load_input_model((dir / "face_relief_missing.brep").string()), relief_error);

	std::filesystem::remove(brep);
}

TEST_CASE("document body id") {
	namespace fs = std::filesystem;

	const auto dir = fs::temp_directory_path() / "face_relief_body_id_test";
	fs::create_directories(dir);

	document out;
	out.set_shape(BRepPrimAPI_MakeBox(10, 10, 10).Shape());
	out.write_brep_file((dir / "box.brep").string().c_str());

	const auto cwd = fs::current_path();
	fs::current_path(dir);

	document doc;
	doc.load_brep_file("box.brep");
	fs::current_path(cwd);

	CHECK(fs::path(doc.body_id).is_absolute());
	CHECK(fs::equivalent(doc.body_id, dir / "box.brep"));
	CHECK(doc.faces.Extent() == 6);

	SECTION("missing and empty files") {
		const auto missing = (dir / "missing.brep").string();
		CHECK_THROWS_WITH(doc.load_brep_file(missing.c_str()), "unable to read BREP file " + missing);
		std::ofstream{dir / "empty.brep"};
		CHECK_THROWS_AS(doc.load_brep_file((dir / "empty.brep").string().c_str()), relief_error);
		CHECK(fs::equivalent(doc.body_id, dir / "box.brep"));
	}

	fs::remove_all(dir);
}
#endif
