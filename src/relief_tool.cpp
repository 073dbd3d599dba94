#include <exception>
#include <functional>
#include <sstream>
#include <vector>

#ifdef INCLUDE_TESTS
#include <new>
#include <stdexcept>
#include <catch2/catch_test_macros.hpp>
#endif

#include <Standard_Failure.hxx>

#include <aixlog.hpp>

#include "errors.hpp"
#include "geometry.hpp"
#include "relief_tool.hpp"


static std::string
help_with_default(const char *what, double val, const char *unit = "")
{
	std::stringstream stream;
	stream << what << " [=" << val << unit << ']';
	return stream.str();
}

void
add_logo_options(tool_argp_parser &argp, logo_params &params)
{
	// argp keeps pointers to the help strings
	static std::vector<std::string> help;
	help = {
		help_with_default("Diameter of the logo circle", params.diameter, "mm"),
		help_with_default("Depth of the circle, other layers are fractions of this", params.total_depth, "mm"),
		help_with_default("Mountain depth as a fraction of the total", params.mountain_ratio),
		help_with_default("Trail depth as a fraction of the total", params.trail_ratio),
		help_with_default("Bolt depth as a fraction of the total", params.bolt_ratio),
		help_with_default("Shift along the face's first axis", params.x_offset, "mm"),
		help_with_default("Shift along the face's second axis", params.y_offset, "mm"),
		help_with_default("Turn about the face normal", params.rotation, "deg"),
	};

	argp.add_option({"diameter", 1024, "D", 0, help[0].c_str(), 0}, params.diameter);
	argp.add_option({"total-depth", 1025, "D", 0, help[1].c_str(), 0}, params.total_depth);
	argp.add_option({"mountain-ratio", 1026, "R", 0, help[2].c_str(), 0}, params.mountain_ratio);
	argp.add_option({"trail-ratio", 1027, "R", 0, help[3].c_str(), 0}, params.trail_ratio);
	argp.add_option({"bolt-ratio", 1028, "R", 0, help[4].c_str(), 0}, params.bolt_ratio);
	argp.add_option({"x-offset", 'x', "MM", 0, help[5].c_str(), 1}, params.x_offset);
	argp.add_option({"y-offset", 'y', "MM", 0, help[6].c_str(), 1}, params.y_offset);
	argp.add_option({"rotation", 'r', "DEG", 0, help[7].c_str(), 1}, params.rotation);
}

void
add_qr_options(tool_argp_parser &argp, qr_params &params)
{
	static std::vector<std::string> help;
	help = {
		help_with_default("Side of the code including the quiet zone", params.size, "mm"),
		help_with_default("How far modules stand out of (or into) the face", params.height, "mm"),
		help_with_default("Quiet zone width in modules", params.border),
		help_with_default("Shift along the face's first axis", params.x_offset, "mm"),
		help_with_default("Shift along the face's second axis", params.y_offset, "mm"),
	};

	argp.add_option(
		{"url", 'u', "TEXT", 0, "Text to encode, usually a URL", 0},
		std::function{[&params](int, const char *arg, struct argp_state*) {
			params.url = arg;
			return 0;
		}});
	argp.add_option({"size", 1024, "MM", 0, help[0].c_str(), 0}, params.size);
	argp.add_option({"height", 1025, "MM", 0, help[1].c_str(), 0}, params.height);
	argp.add_option(
		{"deboss", 'd', nullptr, 0, "Cut the modules into the face instead of raising them", 0},
		std::function{[&params](int, const char *, struct argp_state*) {
			params.emboss = false;
			return 0;
		}});
	argp.add_option(
		{"error-correction", 'e', "L|M|Q|H", 0, "Error correction level [=M]", 0},
		std::function{[&params](int, const char *arg, struct argp_state*) {
			params.error_correction = arg;
			return 0;
		}});
	argp.add_option({"border", 1026, "N", 0, help[2].c_str(), 0}, params.border);
	argp.add_option({"x-offset", 'x', "MM", 0, help[3].c_str(), 1}, params.x_offset);
	argp.add_option({"y-offset", 'y', "MM", 0, help[4].c_str(), 1}, params.y_offset);
}

std::string
load_body_and_face(document &doc, const std::string &path_in, const std::string &face_name)
{
	doc.load_brep_file(path_in.c_str());

	const int idx = doc.lookup_face(face_name);
	if (idx == 0) {
		std::stringstream msg;
		msg << "face '" << face_name << "' not found, body has " << doc.faces.Extent() << " faces";
		throw invalid_parameter(msg.str());
	}
	return document::face_name(idx);
}

void
write_relief_result(
	const TopoDS_Shape &result, const std::string &path_out, const relief_record &record)
{
	if (!is_shape_valid("result", result)) {
		LOG(WARNING) << "result shape has problems, writing it anyway\n";
	}

	document out;
	out.set_shape(result);
	out.write_brep_file(path_out.c_str());

	save_relief_record(record_path_for(path_out), record);

	LOG(INFO) << "wrote " << path_out << '\n';
}

int
run_relief_tool(const std::function<void()> &body)
{
	try {
		body();
	} catch (const relief_error &err) {
		LOG(FATAL) << err.what() << '\n';
		return 1;
	} catch (const Standard_Failure &err) {
		LOG(FATAL) << "geometry kernel: " << err.GetMessageString() << '\n';
		return 1;
	} catch (const std::exception &err) {
		LOG(FATAL) << "unexpected error: " << err.what() << '\n';
		return 1;
	}
	return 0;
}

#ifdef INCLUDE_TESTS
TEST_CASE("run_relief_tool") {
	bool ran = false;
	CHECK(run_relief_tool([&] { ran = true; }) == 0);
	CHECK(ran);

	CHECK(run_relief_tool([] { throw non_planar_face("curved"); }) == 1);
	CHECK(run_relief_tool([] { throw Standard_Failure("kernel gave up"); }) == 1);
	CHECK(run_relief_tool([] { throw std::logic_error("broken"); }) == 1);
	CHECK(run_relief_tool([] { throw std::bad_alloc(); }) == 1);
}
#endif
