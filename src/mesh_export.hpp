#pragma once

#include <string>

#include "document.hpp"


const double default_mesh_tolerance = 0.1;
const double mesh_angular_deflection = 0.5;

/* writes model as STL. a solid shape is triangulated first with the given
 * linear deflection (mm, in (0, 1]), a mesh is written as it is. throws
 * invalid_parameter for a bad tolerance and relief_error if nothing could be
 * written
 */
void export_stl(
	const input_model &model, const std::string &path,
	double linear_tolerance = default_mesh_tolerance, bool ascii = false);
