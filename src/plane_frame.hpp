#pragma once

#include <gp_Dir.hxx>
#include <gp_Pnt.hxx>
#include <gp_Trsf.hxx>
#include <TopoDS_Face.hxx>


// which way local +Z is sent when artwork is placed on a face
enum class relief_mode {
	// cut, local +Z goes into the body (-normal)
	deboss,

	// fuse, local +Z points out of the body (+normal)
	emboss,
};

// orthonormal frame on a planar face. normal points out of the solid and
// normal = u x v
struct plane_frame {
	gp_Pnt origin;
	gp_Dir u_axis, v_axis, normal;
};

// world axis (X, Y or Z) least parallel to normal
gp_Dir seed_axis(const gp_Dir &normal);

// builds the frame from an outward normal and origin, u/v are derived from
// seed_axis() and then rotated by rotation_deg about the normal. the origin
// is shifted in-plane by the offsets along the rotated axes
plane_frame make_plane_frame(
	const gp_Pnt &centroid, const gp_Dir &normal,
	double x_offset = 0, double y_offset = 0, double rotation_deg = 0);

// throws non_planar_face unless face lies on a plane. the normal is taken
// with the face orientation accounted for, origin is the area centroid
plane_frame extract_plane_frame(
	const TopoDS_Face &face,
	double x_offset = 0, double y_offset = 0, double rotation_deg = 0);

// matrix with columns u, v, +/-normal and translation origin
gp_Trsf frame_placement(const plane_frame &frame, relief_mode mode);
