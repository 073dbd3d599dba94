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
	qr_params params;

	{
		const char *doc = (
			"Emboss (or deboss) a QR code onto a planar face of a solid.\n"
			"\n"
			"The code, quiet zone included, is centred on the face and reported "
			"with its module size so you can judge if it will print and scan.");
		const char *usage = "input.brep FaceN output.brep --url TEXT";

		tool_argp_parser argp(3);
		add_qr_options(argp, params);

		if (!argp.parse(argc, argv, usage, doc)) {
			return 1;
		}

		const auto &args = argp.arguments();
		assert(args.size() == 3);
		path_in = args[0];
		face_name = args[1];
		path_out = args[2];

		if (params.url.empty()) {
			LOG(ERROR) << "nothing to encode, give --url\n";
			return 1;
		}
	}

	return run_relief_tool([&] {
		const auto config = default_relief_config();

		document doc;
		face_name = load_body_and_face(doc, path_in, face_name);

		const auto res = apply_qr(config, doc.shape, doc.face(face_name), params);

		LOG(INFO)
			<< "module size " << res.module_size_mm << "mm ("
			<< res.modules << " modules over " << params.size << "mm)\n";

		write_relief_result(res.shape, path_out, {params, doc.body_id, face_name});
	});
}
