#include <cassert>
#include <sstream>
#include <filesystem>

#include <aixlog.hpp>

#include "document.hpp"
#include "errors.hpp"
#include "mesh_export.hpp"
#include "relief_tool.hpp"
#include "studio_launch.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;


int
main(int argc, char **argv)
{
	configure_aixlog();

	std::string path_in, dir_out, scene_script;
	studio_scene scene;
	double tolerance = default_mesh_tolerance;
	bool ascii = false, no_launch = false;

	{
		const char *doc = (
			"Export a model as STL and open it in the renderer with a studio scene.\n"
			"\n"
			"The STL, a copy of the scene script and an open_in_renderer.sh launcher "
			"are written to the output directory.");
		const char *usage = "input.(brep|stl) output_dir --script scene.py";

		std::stringstream stream;
		stream << "Mesh linear deflection, in (0, 1] [=" << tolerance << "mm]";
		const auto help_tolerance = stream.str();
		stream = {};

		stream << "Material, one of";
		for (const auto &m : material_presets()) {
			stream << ' ' << m;
		}
		stream << " [=" << scene.material << ']';
		const auto help_material = stream.str();
		stream = {};

		stream << "Render size, one of";
		for (const auto &r : resolution_presets()) {
			stream << ' ' << r.width << 'x' << r.height;
		}
		const auto help_resolution = stream.str();

		tool_argp_parser argp(2);
		argp.add_option(
			{"script", 1024, "PATH", 0, "Scene script run by the renderer", 0},
			std::function{[&scene_script](int, const char *arg, struct argp_state*) {
				scene_script = arg;
				return 0;
			}});
		argp.add_option(
			{"material", 'm', "NAME", 0, help_material.c_str(), 0},
			std::function{[&scene](int, const char *arg, struct argp_state*) {
				scene.material = arg;
				return 0;
			}});
		argp.add_option(
			{"colour", 'c', "R,G,B", 0, "Model colour, components 0-1 [=0.8,0.8,0.8]", 0},
			std::function{[&scene](int, const char *arg, struct argp_state* state) {
				if (!parse_colour(arg, scene.colour)) {
					argp_error(state, "expected three values in 0-1, not '%s'", arg);
				}
				return 0;
			}});
		argp.add_option(
			{"resolution", 1025, "WxH", 0, help_resolution.c_str(), 0},
			std::function{[&scene](int, const char *arg, struct argp_state* state) {
				if (!parse_resolution(arg, scene.resolution)) {
					argp_error(state, "unsupported resolution '%s'", arg);
				}
				return 0;
			}});
		argp.add_option(
			{"samples", 1026, "N", 0, "Render samples, 32-4096 [=256]", 0}, scene.samples);
		argp.add_option(
			{"focal-length", 1027, "MM", 0, "Camera focal length, 24-200 [=85]", 0}, scene.focal_length);
		argp.add_option(
			{"tolerance", 1028, "MM", 0, help_tolerance.c_str(), 0}, tolerance);
		argp.add_option(
			{"ascii", 1029, nullptr, 0, "Write ASCII rather than binary STL", 0}, ascii);
		argp.add_option(
			{"no-launch", 1030, nullptr, 0, "Only write the files, don't start the renderer", 0}, no_launch);

		if (!argp.parse(argc, argv, usage, doc)) {
			return 1;
		}

		const auto &args = argp.arguments();
		assert(args.size() == 2);
		path_in = args[0];
		dir_out = args[1];

		if (scene_script.empty()) {
			LOG(ERROR) << "no scene script given, use --script\n";
			return 1;
		}
	}

	return run_relief_tool([&] {
		validate_scene(scene);

		const auto renderer = find_renderer();
		if (!renderer) {
			throw missing_dependency(
				"blender not found on PATH or in the usual places, "
				"install it (e.g. sudo snap install blender --classic)");
		}
		LOG(DEBUG) << "using renderer " << *renderer << '\n';

		const auto model = load_input_model(path_in);

		std::error_code ec;
		fs::create_directories(dir_out, ec);
		if (ec) {
			throw relief_error("unable to create " + dir_out + ": " + ec.message());
		}

		const auto stl_path = (fs::path(dir_out) / fs::path(path_in).stem()).string() + ".stl";
		export_stl(model, stl_path, tolerance, ascii);

		const auto script_path = fs::path(dir_out) / fs::path(scene_script).filename();
		if (!fs::equivalent(scene_script, script_path, ec)) {
			fs::copy_file(scene_script, script_path, fs::copy_options::overwrite_existing, ec);
			if (ec) {
				throw relief_error("unable to copy scene script: " + ec.message());
			}
		}

		const auto cmd = build_renderer_command(*renderer, script_path.string(), stl_path, scene);
		const auto launcher = write_launcher(dir_out, cmd);

		if (no_launch || !launch_detached(cmd)) {
			LOG(INFO) << "open the scene with: bash " << shell_quote(launcher) << '\n';
		}
	});
}
