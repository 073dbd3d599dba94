#pragma once

#include <string>
#include <vector>

#include <gp_Pnt2d.hxx>
#include <TopoDS_Shape.hxx>


// the four elements of the brand mark, each a planar shape in the local XY
// plane centred on the origin and clipped to the circle. they overlap, see
// isolate_layers() before extruding them
struct logo_shapes {
	TopoDS_Shape circle, mountain, trail, bolt;
};

struct logotext_shapes {
	logo_shapes logo;

	// placed right of the circle, vertically centred on the origin
	TopoDS_Shape text;
};

// artwork is authored on a 48x48 grid, Y pointing down, around a circle of
// diameter 44 centred at (24, 24)
const double logo_art_diameter = 44;

// scale from artwork units to mm for a circle of the given diameter
double logo_scale(double diameter);

// artwork coordinate to local XY, Y flipped and centred
gp_Pnt2d logo_art_to_local(double x, double y, double scale);

// trail centreline in local coordinates, sampled from its Bezier segments
std::vector<gp_Pnt2d> logo_trail_centreline(double scale);

logo_shapes create_logo_shapes(double diameter);

// text cap height and gap follow the proportions of the website header
const double logotext_cap_ratio = 0.55;
const double logotext_gap_ratio = 0.23;

logotext_shapes create_logotext_shapes(double diameter, const std::string &text);
