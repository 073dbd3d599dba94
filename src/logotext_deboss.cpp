#include <cassert>
#include <sstream>

#include <aixlog.hpp>

#include "document.hpp"
#include "glyph_set.hpp"
#include "relief_ops.hpp"
#include "relief_tool.hpp"
#include "utils.hpp"


int
main(int argc, char **argv)
{
	configure_aixlog();

	std::string path_in, face_name, path_out;
	logotext_params params;

	{
		const std::string doc = (
			"Deboss the logo with text beside it into a planar face of a solid.\n"
			"\n"
			"Text is drawn with built-in block letters, supported characters are: "
			+ supported_characters());
		const char *usage = "input.brep FaceN output.brep";

		std::stringstream stream;
		stream << "Text depth as a fraction of the total [=" << params.text_ratio << ']';
		const auto help_text_ratio = stream.str();

		tool_argp_parser argp(3);
		add_logo_options(argp, params.logo);
		argp.add_option(
			{"text", 't', "STR", 0, "Text to put beside the logo [=TrailCurrent]", 0},
			std::function{[&params](int, const char *arg, struct argp_state*) {
				params.text = arg;
				return 0;
			}});
		argp.add_option(
			{"text-ratio", 1100, "R", 0, help_text_ratio.c_str(), 0}, params.text_ratio);

		if (!argp.parse(argc, argv, usage, doc.c_str())) {
			return 1;
		}

		const auto &args = argp.arguments();
		assert(args.size() == 3);
		path_in = args[0];
		face_name = args[1];
		path_out = args[2];
	}

	return run_relief_tool([&] {
		document doc;
		face_name = load_body_and_face(doc, path_in, face_name);

		const auto result = apply_logotext(doc.shape, doc.face(face_name), params);

		write_relief_result(result, path_out, {params, doc.body_id, face_name});
	});
}
