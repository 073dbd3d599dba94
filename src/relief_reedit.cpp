#include <cassert>
#include <utility>
#include <vector>

#include <aixlog.hpp>

#include "document.hpp"
#include "relief_ops.hpp"
#include "relief_tool.hpp"
#include "utils.hpp"


int
main(int argc, char **argv)
{
	configure_aixlog();

	std::string path_record, path_out;
	std::vector<std::pair<std::string, std::string>> overrides;

	{
		const char *doc = (
			"Rebuild a relief from its saved record, optionally changing some of its values.\n"
			"\n"
			"The relief is made again from the original body, the previous result is "
			"not used.  Keys are those in the record, e.g. --set total_depth=1.2 --set face=Face3");
		const char *usage = "record.csv output.brep";

		tool_argp_parser argp(2);
		argp.add_option(
			{"set", 's', "KEY=VALUE", 0, "Replace a value in the record, can be repeated", 0},
			std::function{[&overrides](int, const char *arg, struct argp_state* state) {
				const std::string str{arg};
				const auto eq = str.find('=');
				if (eq == std::string::npos || eq == 0) {
					argp_error(state, "expected KEY=VALUE, not '%s'", arg);
				} else {
					overrides.emplace_back(str.substr(0, eq), str.substr(eq + 1));
				}
				return 0;
			}});

		if (!argp.parse(argc, argv, usage, doc)) {
			return 1;
		}

		const auto &args = argp.arguments();
		assert(args.size() == 2);
		path_record = args[0];
		path_out = args[1];
	}

	return run_relief_tool([&] {
		auto record = load_relief_record(path_record);
		for (const auto &kv : overrides) {
			LOG(DEBUG) << "setting " << kv.first << " to " << kv.second << '\n';
			override_record_field(record, kv.first, kv.second);
		}

		const auto config = default_relief_config();

		document doc;
		record.face_id = load_body_and_face(doc, record.body_id, record.face_id);

		const auto result = apply_record(config, doc, record);

		write_relief_result(result, path_out, record);
	});
}
