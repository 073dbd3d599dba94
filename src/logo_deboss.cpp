#include <cassert>

#include <aixlog.hpp>

#include "document.hpp"
#include "relief_ops.hpp"
#include "relief_tool.hpp"
#include "utils.hpp"


int
main(int argc, char **argv)
{
	configure_aixlog();

	std::string path_in, face_name, path_out;
	logo_params params;

	{
		const char *doc = (
			"Deboss the logo into a planar face of a solid, writing the result to a BREP file.\n"
			"\n"
			"The circle is cut to the total depth and the mountain, trail and bolt "
			"to their fractions of it.  The parameters are saved next to the output "
			"for relief_reedit.");
		const char *usage = "input.brep FaceN output.brep";

		tool_argp_parser argp(3);
		add_logo_options(argp, params);

		if (!argp.parse(argc, argv, usage, doc)) {
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

		const auto result = apply_logo(doc.shape, doc.face(face_name), params);

		write_relief_result(result, path_out, {params, doc.body_id, face_name});
	});
}
