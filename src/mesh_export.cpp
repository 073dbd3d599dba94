#include <sstream>

#ifdef INCLUDE_TESTS
#include <filesystem>
#include <catch2/catch_test_macros.hpp>
#endif

#include <BRepMesh_IncrementalMesh.hxx>
#include <OSD_Path.hxx>
#include <RWStl.hxx>
#include <StlAPI_Writer.hxx>

#include <aixlog.hpp>

#include "errors.hpp"
#include "mesh_export.hpp"


static void
write_shape(const TopoDS_Shape &shape, const std::string &path, double tolerance, bool ascii)
{
	BRepMesh_IncrementalMesh mesher{shape, tolerance, false, mesh_angular_deflection, false};
	if (!mesher.IsDone()) {
		throw relief_error("unable to triangulate shape for " + path);
	}

	StlAPI_Writer writer;
	writer.ASCIIMode() = ascii;
	if (!writer.Write(shape, path.c_str())) {
		throw relief_error("unable to write STL file " + path);
	}
}

static void
write_mesh(const Handle(Poly_Triangulation) &mesh, const std::string &path, bool ascii)
{
	const OSD_Path osd_path{path.c_str()};
	const bool ok = ascii ?
		RWStl::WriteAscii(mesh, osd_path) :
		RWStl::WriteBinary(mesh, osd_path);
	if (!ok) {
		throw relief_error("unable to write STL file " + path);
	}
}

void
export_stl(
	const input_model &model, const std::string &path,
	double linear_tolerance, bool ascii)
{
	if (!(linear_tolerance > 0 && linear_tolerance <= 1)) {
		std::stringstream msg;
		msg << "mesh tolerance " << linear_tolerance << " outside (0, 1]";
		throw invalid_parameter(msg.str());
	}

	if (model.has_solid_shape) {
		LOG(DEBUG) << "meshing shape with deflection " << linear_tolerance << "mm\n";
		write_shape(model.shape, path, linear_tolerance, ascii);
	} else if (model.has_mesh) {
		write_mesh(model.mesh, path, ascii);
	} else {
		throw relief_error("model has neither a shape nor a mesh to export");
	}

	LOG(INFO) << "wrote " << (ascii ? "ascii" : "binary") << " STL to " << path << '\n';
}

#ifdef INCLUDE_TESTS
#include <BRepPrimAPI_MakeBox.hxx>

TEST_CASE("export_stl") {
	const auto dir = std::filesystem::temp_directory_path();
	const auto stl = (dir / "face_relief_export_test.stl").string();
	const auto copy = (dir / "face_relief_export_copy.stl").string();

	input_model box{true, false, BRepPrimAPI_MakeBox(10, 10, 10).Shape(), {}};

	SECTION("solid then mesh") {
		export_stl(box, stl);

		const auto mesh = load_input_model(stl);
		REQUIRE(mesh.has_mesh);
		CHECK_FALSE(mesh.has_solid_shape);
		CHECK(mesh.mesh->NbTriangles() == 12);

		export_stl(mesh, copy, default_mesh_tolerance, true);
		CHECK(load_input_model(copy).mesh->NbTriangles() == 12);
	}

	SECTION("bad tolerance") {
		CHECK_THROWS_AS(export_stl(box, stl, 0), invalid_parameter);
		CHECK_THROWS_AS(export_stl(box, stl, 1.5), invalid_parameter);
	}

	SECTION("nothing to write") {
		CHECK_THROWS_AS(export_stl(input_model{false, false, {}, {}}, stl), relief_error);
	}

	std::filesystem::remove(stl);
	std::filesystem::remove(copy);
}
#endif
