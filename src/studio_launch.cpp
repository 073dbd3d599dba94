#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef INCLUDE_TESTS
#include <catch2/catch_test_macros.hpp>
#endif

#include <aixlog.hpp>

#include "errors.hpp"
#include "studio_launch.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;


static const char *renderer_name = "blender";

static const char *renderer_fallbacks[] = {
	"/snap/bin/blender",
	"/usr/bin/blender",
	"/usr/local/bin/blender",
	"/opt/blender/blender",
};

static const int min_samples = 32, max_samples = 4096;
static const double min_focal_length = 24, max_focal_length = 200;

const std::vector<std::string> &
material_presets()
{
	static const std::vector<std::string> presets = {
		"match_host",
		"white_plastic",
		"dark_grey_plastic",
		"brushed_aluminum",
		"raw",
	};
	return presets;
}

const std::vector<render_resolution> &
resolution_presets()
{
	static const std::vector<render_resolution> presets = {
		{1920, 1080},
		{2560, 1440},
		{3840, 2160},
		{1080, 1080},
	};
	return presets;
}

bool
parse_resolution(const std::string &str, render_resolution &res)
{
	const auto x = str.find('x');
	if (x == std::string::npos) {
		return false;
	}

	int width, height;
	if (!int_of_string(str.substr(0, x).c_str(), width, 10) ||
		!int_of_string(str.substr(x + 1).c_str(), height, 10)) {
		return false;
	}

	for (const auto &preset : resolution_presets()) {
		if (preset.width == width && preset.height == height) {
			res = preset;
			return true;
		}
	}
	return false;
}

bool
parse_colour(const std::string &str, std::array<double, 3> &colour)
{
	const auto fields = parse_csv_row(str);
	if (fields.size() != 3) {
		return false;
	}

	std::array<double, 3> out;
	for (size_t i = 0; i < 3; i++) {
		if (!double_of_string(fields[i].c_str(), out[i]) || out[i] < 0 || out[i] > 1) {
			return false;
		}
	}
	colour = out;
	return true;
}

void
validate_scene(const studio_scene &scene)
{
	const auto &materials = material_presets();
	if (std::find(materials.begin(), materials.end(), scene.material) == materials.end()) {
		throw invalid_parameter("unknown material preset '" + scene.material + "'");
	}

	bool known = false;
	for (const auto &preset : resolution_presets()) {
		known |= preset.width == scene.resolution.width && preset.height == scene.resolution.height;
	}
	if (!known) {
		throw invalid_parameter("resolution is not one of the presets");
	}

	for (const double c : scene.colour) {
		if (!(c >= 0 && c <= 1)) {
			throw invalid_parameter("colour components must be between 0 and 1");
		}
	}

	if (scene.samples < min_samples || scene.samples > max_samples) {
		std::stringstream msg;
		msg << "samples must be between " << min_samples << " and " << max_samples;
		throw invalid_parameter(msg.str());
	}

	if (!(scene.focal_length >= min_focal_length && scene.focal_length <= max_focal_length)) {
		std::stringstream msg;
		msg << "focal length must be between " << min_focal_length << " and " << max_focal_length << "mm";
		throw invalid_parameter(msg.str());
	}
}

std::vector<std::string>
build_renderer_command(
	const std::string &renderer, const std::string &scene_script,
	const std::string &stl_path, const studio_scene &scene)
{
	validate_scene(scene);

	std::stringstream colour;
	colour << std::fixed << std::setprecision(3)
		<< scene.colour[0] << ',' << scene.colour[1] << ',' << scene.colour[2];

	std::stringstream focal;
	focal << scene.focal_length;

	return {
		renderer,
		"--python", scene_script,
		"--",
		"--stl", stl_path,
		"--material", scene.material,
		"--freecad-color", colour.str(),
		"--resolution", std::to_string(scene.resolution.width), std::to_string(scene.resolution.height),
		"--samples", std::to_string(scene.samples),
		"--focal-length", focal.str(),
	};
}

static bool
is_bare_shell_char(char c)
{
	return std::isalnum((unsigned char)c) || std::strchr("-_./=:", c) != nullptr;
}

std::string
shell_quote(const std::string &token)
{
	if (!token.empty() && std::all_of(token.begin(), token.end(), is_bare_shell_char)) {
		return token;
	}

	std::string out = "'";
	for (const char c : token) {
		if (c == '\'') {
			out += "'\\''";
		} else {
			out += c;
		}
	}
	out += '\'';
	return out;
}

std::string
write_launcher(const std::string &dir, const std::vector<std::string> &cmd)
{
	const auto path = (fs::path(dir) / "open_in_renderer.sh").string();

	std::ofstream os{path};
	if (!os) {
		throw relief_error("unable to write launcher " + path);
	}

	os << "#!/bin/bash\n";
	for (size_t i = 0; i < cmd.size(); i++) {
		os << (i ? " " : "") << shell_quote(cmd[i]);
	}
	os << '\n';
	os.close();
	if (os.fail()) {
		throw relief_error("error writing launcher " + path);
	}

	std::error_code ec;
	fs::permissions(
		path,
		fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
		fs::perms::others_read | fs::perms::others_exec,
		ec);
	if (ec) {
		throw relief_error("unable to make launcher executable: " + ec.message());
	}

	LOG(DEBUG) << "wrote launcher " << path << '\n';
	return path;
}

static bool
is_executable_file(const std::string &path)
{
	std::error_code ec;
	return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

std::optional<std::string>
find_renderer(const char *search_path)
{
	if (search_path == nullptr) {
		search_path = std::getenv("PATH");
	}

	if (search_path != nullptr) {
		std::stringstream dirs{search_path};
		std::string dir;
		while (std::getline(dirs, dir, ':')) {
			if (dir.empty()) {
				continue;
			}
			const auto candidate = (fs::path(dir) / renderer_name).string();
			if (is_executable_file(candidate)) {
				return candidate;
			}
		}
	}

	for (const char *candidate : renderer_fallbacks) {
		if (is_executable_file(candidate)) {
			return std::string(candidate);
		}
	}
	return std::nullopt;
}

bool
launch_detached(const std::vector<std::string> &cmd)
{
	if (cmd.empty()) {
		return false;
	}

	std::vector<char *> argv;
	for (const auto &arg : cmd) {
		argv.push_back(const_cast<char *>(arg.c_str()));
	}
	argv.push_back(nullptr);

	// the exec failure, if any, comes back through a close-on-exec pipe
	int fds[2];
	if (pipe2(fds, O_CLOEXEC) != 0) {
		LOG(WARNING) << "unable to start " << cmd[0] << ": " << std::strerror(errno) << '\n';
		return false;
	}

	const pid_t pid = fork();
	if (pid == 0) {
		close(fds[0]);
		// own session so the renderer outlives us
		setsid();
		const int devnull = open("/dev/null", O_RDONLY);
		if (devnull >= 0) {
			dup2(devnull, STDIN_FILENO);
			close(devnull);
		}
		execvp(argv[0], argv.data());
		const int err = errno;
		ssize_t n;
		do {
			n = write(fds[1], &err, sizeof(err));
		} while (n < 0 && errno == EINTR);
		_exit(127);
	}
	close(fds[1]);
	if (pid < 0) {
		close(fds[0]);
		LOG(WARNING) << "unable to start " << cmd[0] << ": " << std::strerror(errno) << '\n';
		return false;
	}

	int child_err = 0;
	ssize_t n;
	do {
		n = read(fds[0], &child_err, sizeof(child_err));
	} while (n < 0 && errno == EINTR);
	close(fds[0]);

	if (n > 0) {
		waitpid(pid, nullptr, 0);
		LOG(WARNING) << "unable to run " << cmd[0] << ": " << std::strerror(child_err) << '\n';
		return false;
	}

	LOG(INFO) << "started " << cmd[0] << ", pid " << pid << '\n';
	return true;
}

#ifdef INCLUDE_TESTS
TEST_CASE("shell_quote") {
	CHECK(shell_quote("blender") == "blender");
	CHECK(shell_quote("/tmp/out_dir/part-1.stl") == "/tmp/out_dir/part-1.stl");
	CHECK(shell_quote("--freecad-color=0.8:1") == "--freecad-color=0.8:1");
	CHECK(shell_quote("0.800,0.800,0.800") == "'0.800,0.800,0.800'");
	CHECK(shell_quote("my part.stl") == "'my part.stl'");
	CHECK(shell_quote("it's") == "'it'\\''s'");
	CHECK(shell_quote("") == "''");
}

TEST_CASE("scene parameters") {
	render_resolution res{0, 0};
	CHECK(parse_resolution("2560x1440", res));
	CHECK(res.width == 2560);
	CHECK(res.height == 1440);
	CHECK_FALSE(parse_resolution("640x480", res));
	CHECK_FALSE(parse_resolution("1920", res));

	std::array<double, 3> colour{{0, 0, 0}};
	CHECK(parse_colour("0.1,0.5,1", colour));
	CHECK(colour[1] == 0.5);
	CHECK_FALSE(parse_colour("0.1,0.5", colour));
	CHECK_FALSE(parse_colour("0.1,0.5,2", colour));

	studio_scene scene;
	CHECK_NOTHROW(validate_scene(scene));

	scene.samples = 16;
	CHECK_THROWS_AS(validate_scene(scene), invalid_parameter);
	scene.samples = 256;
	scene.material = "gold";
	CHECK_THROWS_AS(validate_scene(scene), invalid_parameter);
	scene.material = "raw";
	scene.focal_length = 300;
	CHECK_THROWS_AS(validate_scene(scene), invalid_parameter);
}

TEST_CASE("build_renderer_command") {
	studio_scene scene;
	scene.material = "white_plastic";
	scene.resolution = {1080, 1080};

	const auto cmd = build_renderer_command("/usr/bin/blender", "/tmp/s/studio.py", "/tmp/s/part.stl", scene);

	const std::vector<std::string> expected = {
		"/usr/bin/blender", "--python", "/tmp/s/studio.py", "--",
		"--stl", "/tmp/s/part.stl",
		"--material", "white_plastic",
		"--freecad-color", "0.800,0.800,0.800",
		"--resolution", "1080", "1080",
		"--samples", "256",
		"--focal-length", "85",
	};
	CHECK(cmd == expected);
}

TEST_CASE("write_launcher") {
	const auto dir = fs::temp_directory_path() / "face_relief_launcher_test";
	fs::create_directories(dir);

	const auto path = write_launcher(dir.string(), {"blender", "--stl", "my part.stl"});

	std::ifstream is{path};
	std::stringstream content;
	content << is.rdbuf();
	CHECK(content.str() == "#!/bin/bash\nblender --stl 'my part.stl'\n");
	CHECK(access(path.c_str(), X_OK) == 0);

	fs::remove_all(dir);
}

TEST_CASE("find_renderer") {
	const auto dir = fs::temp_directory_path() / "face_relief_find_test";
	fs::create_directories(dir);
	const auto fake = dir / "blender";
	std::ofstream{fake} << "#!/bin/sh\n";

	const auto search = "/nonexistent:" + dir.string();

	SECTION("not executable yet") {
		const auto found = find_renderer(search.c_str());
		CHECK((!found || *found != fake.string()));
	}
	SECTION("found on the search path") {
		fs::permissions(fake, fs::perms::owner_all);
		const auto found = find_renderer(search.c_str());
		REQUIRE(found);
		CHECK(*found == fake.string());
	}

	fs::remove_all(dir);
}

TEST_CASE("launch_detached") {
	CHECK_FALSE(launch_detached({}));
	CHECK_FALSE(launch_detached({"/nonexistent/face_relief_renderer", "--background"}));
	CHECK(launch_detached({"true"}));
}
#endif
