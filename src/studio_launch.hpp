#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>


struct render_resolution {
	int width, height;
};

// parameters handed to the renderer's scene script, the scene itself is
// built by that script
struct studio_scene {
	std::string material = "match_host";
	std::array<double, 3> colour = {{0.8, 0.8, 0.8}};
	render_resolution resolution = {1920, 1080};
	int samples = 256;
	double focal_length = 85;
};

const std::vector<std::string> &material_presets();
const std::vector<render_resolution> &resolution_presets();

// "WxH" naming one of resolution_presets()
bool parse_resolution(const std::string &str, render_resolution &res);

// "r,g,b" each in 0-1
bool parse_colour(const std::string &str, std::array<double, 3> &colour);

// throws invalid_parameter for anything outside the presets or ranges
void validate_scene(const studio_scene &scene);

std::vector<std::string> build_renderer_command(
	const std::string &renderer, const std::string &scene_script,
	const std::string &stl_path, const studio_scene &scene);

// leaves tokens of [A-Za-z0-9-_./=:] bare, single quotes everything else
std::string shell_quote(const std::string &token);

// writes an executable open_in_renderer.sh into dir running cmd, returns its path
std::string write_launcher(const std::string &dir, const std::vector<std::string> &cmd);

// renderer executable on search_path (colon separated, $PATH when null),
// then a few fixed install locations
std::optional<std::string> find_renderer(const char *search_path = nullptr);

// starts cmd without waiting for it, false if it couldn't be started
bool launch_detached(const std::vector<std::string> &cmd);
