#pragma once

#include <vector>

#include <gp_Pnt2d.hxx>
#include <TopoDS_Face.hxx>
#include <TopoDS_Shape.hxx>


// closed outline in the local XY plane, first point is not repeated at the end
typedef std::vector<gp_Pnt2d> polygon2d;

// shoelace area, positive when counter-clockwise
double signed_area(const polygon2d &poly);

// planar face at Z=0 with its normal along +Z whatever the winding
TopoDS_Face make_polygon_face(const polygon2d &poly);

// disc of given diameter centred at the origin, normal along +Z
TopoDS_Face make_disc_face(double diameter);

TopoDS_Shape translate_shape(const TopoDS_Shape &shape, double dx, double dy);

// fuses every shape in order, shapes must not be empty
TopoDS_Shape fuse_all(const std::vector<TopoDS_Shape> &shapes, const char *what);

struct bounds2d {
	double xmin, ymin, xmax, ymax;
};

bounds2d shape_bounds(const TopoDS_Shape &shape);
