#pragma once

#include <vector>

#include <TopoDS_Shape.hxx>

#include "layer_isolator.hpp"
#include "plane_frame.hpp"


// layers shallower than this would extrude to a degenerate solid
const double min_layer_depth = 1e-4;

// prism of a planar shape in the local XY plane along +Z
TopoDS_Shape extrude_layer(const TopoDS_Shape &shape, double depth);

// copy of a local solid moved onto the face frame
TopoDS_Shape place_on_frame(const TopoDS_Shape &solid, const plane_frame &frame, relief_mode mode);

/* cuts (deboss) or fuses (emboss) each placed solid into a copy of base in
 * order. any failed step throws boolean_operation_failed, base is left as it
 * was
 */
TopoDS_Shape combine_with_base(
	const TopoDS_Shape &base, const std::vector<TopoDS_Shape> &placed, relief_mode mode);

// extrudes the isolated layers, skipping any thinner than min_layer_depth,
// places them on the frame and combines them with base
TopoDS_Shape assemble_relief(
	const TopoDS_Shape &base, const plane_frame &frame, relief_mode mode,
	const std::vector<relief_layer> &layers);
