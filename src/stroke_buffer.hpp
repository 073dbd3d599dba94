#pragma once

#include <vector>

#include <gp_Pnt2d.hxx>

#include "shape2d.hpp"


// points along a quadratic Bezier, segments+1 of them including both ends
std::vector<gp_Pnt2d> sample_quadratic_bezier(
	const gp_Pnt2d &p0, const gp_Pnt2d &p1, const gp_Pnt2d &p2, int segments);

/* converts an open centreline into a closed outline half_width either side
 * of it, like filling a stroke with round caps. the boundary is walked as
 * left side (forward), end cap, right side (reversed), start cap
 *
 * zero length steps in the centreline are skipped, and an empty polygon is
 * returned for fewer than two distinct points
 */
polygon2d buffer_path(
	const std::vector<gp_Pnt2d> &centreline, double half_width, int cap_segments = 8);
