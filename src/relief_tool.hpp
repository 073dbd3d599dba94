#pragma once

#include <functional>
#include <string>

#include <TopoDS_Shape.hxx>

#include "document.hpp"
#include "relief_params.hpp"
#include "utils.hpp"


// command line options shared by the relief tools, defaults are shown in
// the help text
void add_logo_options(tool_argp_parser &argp, logo_params &params);
void add_qr_options(tool_argp_parser &argp, qr_params &params);

// positional "input.brep FaceN output.brep", loads the body into doc and
// returns the face name after checking it exists
std::string load_body_and_face(document &doc, const std::string &path_in, const std::string &face_name);

// writes the result as BREP and its record next to it
void write_relief_result(
	const TopoDS_Shape &result, const std::string &path_out, const relief_record &record);

// runs the body of a tool, anything it throws is logged and gives exit status 1
int run_relief_tool(const std::function<void()> &body);
