#include <cmath>
#include <sstream>

#ifdef INCLUDE_TESTS
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#endif

#include <BRepAdaptor_Surface.hxx>
#include <BRepGProp.hxx>
#include <BRepGProp_Face.hxx>
#include <BRep_Tool.hxx>
#include <GProp_GProps.hxx>
#include <GeomAbs_SurfaceType.hxx>
#include <GeomLib_IsPlanarSurface.hxx>
#include <gp.hxx>
#include <gp_Pln.hxx>
#include <gp_Vec.hxx>

#include <aixlog.hpp>

#include "errors.hpp"
#include "plane_frame.hpp"


// how far the plane's own axis and the sampled normal may disagree
static const double normal_agreement = 1e-6;

gp_Dir
seed_axis(const gp_Dir &normal)
{
	const double
		ax = std::abs(normal.X()),
		ay = std::abs(normal.Y()),
		az = std::abs(normal.Z());

	if (ax <= ay && ax <= az) {
		return gp_Dir(1, 0, 0);
	} else if (ay <= ax && ay <= az) {
		return gp_Dir(0, 1, 0);
	}
	return gp_Dir(0, 0, 1);
}

plane_frame
make_plane_frame(
	const gp_Pnt &centroid, const gp_Dir &normal,
	double x_offset, double y_offset, double rotation_deg)
{
	// seed is never parallel to normal, so neither cross product vanishes
	gp_Dir u_axis = normal.Crossed(seed_axis(normal));
	gp_Dir v_axis = normal.Crossed(u_axis);

	if (rotation_deg != 0) {
		const double
			rad = rotation_deg * M_PI / 180.,
			c = std::cos(rad),
			s = std::sin(rad);
		const gp_Vec
			u{u_axis}, v{v_axis},
			u_rot = u * c + v * s,
			v_rot = u * -s + v * c;
		u_axis = gp_Dir(u_rot);
		v_axis = gp_Dir(v_rot);
	}

	const gp_Pnt origin = centroid.Translated(
		gp_Vec(u_axis) * x_offset + gp_Vec(v_axis) * y_offset);

	return {origin, u_axis, v_axis, normal};
}

static gp_Dir
sample_normal_at_midpoint(const TopoDS_Face &face)
{
	// BRepGProp_Face reverses the normal for reversed faces, so this points
	// out of the solid rather than along the raw surface
	BRepGProp_Face props{face};

	double umin, umax, vmin, vmax;
	props.Bounds(umin, umax, vmin, vmax);

	gp_Pnt pnt;
	gp_Vec nrm;
	props.Normal((umin + umax) / 2., (vmin + vmax) / 2., pnt, nrm);

	if (nrm.Magnitude() < gp::Resolution()) {
		throw non_planar_face("face normal is degenerate at its parametric midpoint");
	}
	return gp_Dir(nrm);
}

plane_frame
extract_plane_frame(
	const TopoDS_Face &face,
	double x_offset, double y_offset, double rotation_deg)
{
	if (face.IsNull()) {
		throw non_planar_face("no face given");
	}

	BRepAdaptor_Surface surface{face, false};

	const gp_Dir sampled = sample_normal_at_midpoint(face);

	if (surface.GetType() == GeomAbs_Plane) {
		gp_Dir axis = surface.Plane().Axis().Direction();
		if (face.Orientation() == TopAbs_REVERSED) {
			axis.Reverse();
		}
		if (axis.Dot(sampled) < 1 - normal_agreement) {
			std::stringstream msg;
			msg << "plane axis and sampled normal disagree, dot=" << axis.Dot(sampled);
			throw non_planar_face(msg.str());
		}
	} else {
		// other surface types (e.g. a flat b-spline) are accepted when they
		// are planar to within the face tolerance
		GeomLib_IsPlanarSurface check{
			BRep_Tool::Surface(face), BRep_Tool::Tolerance(face)};
		if (!check.IsPlanar()) {
			throw non_planar_face("selected face is not planar, relief needs a flat face");
		}
		if (std::abs(check.Plan().Axis().Direction().Dot(sampled)) < 1 - normal_agreement) {
			throw non_planar_face("face is planar but its sampled normal is not");
		}
		LOG(DEBUG) << "face surface is not a plane but is flat, accepting it\n";
	}

	GProp_GProps props;
	BRepGProp::SurfaceProperties(face, props);

	const auto frame = make_plane_frame(
		props.CentreOfMass(), sampled, x_offset, y_offset, rotation_deg);

	LOG(TRACE)
		<< "face frame origin=(" << frame.origin.X() << ", " << frame.origin.Y() << ", " << frame.origin.Z()
		<< ") normal=(" << frame.normal.X() << ", " << frame.normal.Y() << ", " << frame.normal.Z() << ")\n";

	return frame;
}

gp_Trsf
frame_placement(const plane_frame &frame, relief_mode mode)
{
	const gp_Dir
		&u = frame.u_axis,
		&v = frame.v_axis,
		z = mode == relief_mode::emboss ? frame.normal : frame.normal.Reversed();
	const gp_Pnt &o = frame.origin;

	// a deboss frame is left-handed, gp_Trsf keeps that as a negative scale
	gp_Trsf trsf;
	trsf.SetValues(
		u.X(), v.X(), z.X(), o.X(),
		u.Y(), v.Y(), z.Y(), o.Y(),
		u.Z(), v.Z(), z.Z(), o.Z());
	return trsf;
}

#ifdef INCLUDE_TESTS
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepPrimAPI_MakeBox.hxx>
#include <BRepPrimAPI_MakeCylinder.hxx>
#include <GeomAPI_PointsToBSplineSurface.hxx>
#include <TColgp_Array2OfPnt.hxx>
#include <TopExp_Explorer.hxx>
#include <TopoDS.hxx>

// 30x30 face through a 4x4 grid of points at z=0, bump raises the middle four
static TopoDS_Face
bspline_face(double bump)
{
	TColgp_Array2OfPnt pts(1, 4, 1, 4);
	for (int i = 1; i <= 4; i++) {
		for (int j = 1; j <= 4; j++) {
			const bool middle = (i == 2 || i == 3) && (j == 2 || j == 3);
			pts.SetValue(i, j, gp_Pnt(10 * (i - 1), 10 * (j - 1), middle ? bump : 0));
		}
	}
	GeomAPI_PointsToBSplineSurface fit(pts);
	return BRepBuilderAPI_MakeFace(fit.Surface(), 1e-6).Face();
}

static void
check_orthonormal(const plane_frame &f)
{
	CHECK(std::abs(f.u_axis.Dot(f.v_axis)) < 1e-9);
	CHECK(std::abs(f.u_axis.Dot(f.normal)) < 1e-9);
	CHECK(std::abs(f.v_axis.Dot(f.normal)) < 1e-9);
	CHECK(f.u_axis.Crossed(f.v_axis).Dot(f.normal) == Catch::Approx(1));
}

TEST_CASE("seed_axis") {
	CHECK(seed_axis(gp_Dir(0, 0, 1)).IsEqual(gp_Dir(1, 0, 0), 1e-12));
	CHECK(seed_axis(gp_Dir(1, 0, 0)).IsEqual(gp_Dir(0, 1, 0), 1e-12));
	CHECK(seed_axis(gp_Dir(0.1, 0.9, 0.05)).IsEqual(gp_Dir(0, 0, 1), 1e-12));
}

TEST_CASE("extract_plane_frame on box faces") {
	using Catch::Approx;

	const auto box = BRepPrimAPI_MakeBox(gp_Pnt(0, 0, 0), 10, 20, 30).Shape();
	const gp_Pnt centre(5, 10, 15);

	int nfaces = 0;
	for (TopExp_Explorer ex{box, TopAbs_FACE}; ex.More(); ex.Next()) {
		const auto frame = extract_plane_frame(TopoDS::Face(ex.Current()));
		nfaces += 1;

		check_orthonormal(frame);

		// outward: the centroid sits on the side of the box the normal points to
		const gp_Vec out{centre, frame.origin};
		CHECK(out.Dot(gp_Vec(frame.normal)) > 0);
	}
	CHECK(nfaces == 6);
}

TEST_CASE("make_plane_frame offsets and rotation") {
	using Catch::Approx;

	const gp_Pnt centroid(1, 2, 3);
	const gp_Dir up(0, 0, 1);

	const auto plain = make_plane_frame(centroid, up);
	check_orthonormal(plain);
	CHECK(plain.origin.IsEqual(centroid, 1e-12));

	SECTION("offset moves along u and v") {
		const auto f = make_plane_frame(centroid, up, 2, -3);
		const gp_Vec d{centroid, f.origin};
		CHECK(d.Dot(gp_Vec(plain.u_axis)) == Approx(2));
		CHECK(d.Dot(gp_Vec(plain.v_axis)) == Approx(-3));
		CHECK(std::abs(d.Dot(gp_Vec(up))) < 1e-12);
	}

	SECTION("quarter turn swaps the axes") {
		const auto f = make_plane_frame(centroid, up, 0, 0, 90);
		check_orthonormal(f);
		CHECK(f.u_axis.IsEqual(plain.v_axis, 1e-9));
		CHECK(f.v_axis.IsEqual(plain.u_axis.Reversed(), 1e-9));
	}

	SECTION("offsets follow the rotated axes") {
		const auto f = make_plane_frame(centroid, up, 4, 0, 90);
		const gp_Vec d{centroid, f.origin};
		CHECK(d.Dot(gp_Vec(plain.v_axis)) == Approx(4));
	}
}

TEST_CASE("extract_plane_frame rejects curved faces") {
	const auto cyl = BRepPrimAPI_MakeCylinder(5, 10).Shape();

	int ncurved = 0;
	for (TopExp_Explorer ex{cyl, TopAbs_FACE}; ex.More(); ex.Next()) {
		const auto &face = TopoDS::Face(ex.Current());
		if (BRepAdaptor_Surface(face).GetType() == GeomAbs_Plane) {
			CHECK_NOTHROW(extract_plane_frame(face));
		} else {
			CHECK_THROWS_AS(extract_plane_frame(face), non_planar_face);
			ncurved += 1;
		}
	}
	CHECK(ncurved == 1);
}

TEST_CASE("extract_plane_frame on b-spline faces") {
	using Catch::Approx;

	SECTION("flat") {
		const auto face = bspline_face(0);
		REQUIRE(BRepAdaptor_Surface(face).GetType() == GeomAbs_BSplineSurface);

		const auto frame = extract_plane_frame(face);
		check_orthonormal(frame);
		CHECK(std::abs(frame.normal.Z()) == Approx(1));
		CHECK(frame.origin.X() == Approx(15).margin(1e-3));
		CHECK(frame.origin.Y() == Approx(15).margin(1e-3));
		CHECK(frame.origin.Z() == Approx(0).margin(1e-6));
	}
	SECTION("bumped") {
		CHECK_THROWS_AS(extract_plane_frame(bspline_face(3)), non_planar_face);
	}
}

TEST_CASE("frame_placement") {
	const auto frame = make_plane_frame(gp_Pnt(0, 0, 10), gp_Dir(0, 0, 1));

	const gp_Pnt
		emb = gp_Pnt(0, 0, 1).Transformed(frame_placement(frame, relief_mode::emboss)),
		deb = gp_Pnt(0, 0, 1).Transformed(frame_placement(frame, relief_mode::deboss)),
		along_u = gp_Pnt(1, 0, 0).Transformed(frame_placement(frame, relief_mode::deboss));

	CHECK(emb.IsEqual(gp_Pnt(0, 0, 11), 1e-9));
	CHECK(deb.IsEqual(gp_Pnt(0, 0, 9), 1e-9));
	CHECK(along_u.IsEqual(frame.origin.Translated(gp_Vec(frame.u_axis)), 1e-9));
}
#endif
