#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <variant>


// all depths are fractions of total_depth, the circle uses it directly
struct logo_params {
	double diameter = 18;
	double total_depth = 0.8;
	double mountain_ratio = 0.55;
	double trail_ratio = 0.30;
	double bolt_ratio = 0.15;

	// in-plane shift along the face axes (mm) and turn about the normal (deg)
	double x_offset = 0, y_offset = 0, rotation = 0;
};

struct logotext_params {
	logo_params logo;
	std::string text = "TrailCurrent";
	double text_ratio = 1.0;
};

struct qr_params {
	std::string url;
	double size = 20;
	double height = 0.5;
	bool emboss = true;
	std::string error_correction = "M";
	int border = 2;
	double x_offset = 0, y_offset = 0;
};

// everything needed to rebuild a relief from the original body
struct relief_record {
	std::variant<logo_params, logotext_params, qr_params> params;

	// source body, the path it was loaded from
	std::string body_id;
	// source face as "FaceN"
	std::string face_id;
};

const char *record_kind(const relief_record &record);

/* key,value rows, the first being "kind,<logo|logotext|qr>". throws
 * invalid_parameter on an unknown kind or key, a missing required key or a
 * value that doesn't parse. offsets and rotation may be left out
 */
relief_record read_relief_record(std::istream &is);
void write_relief_record(std::ostream &os, const relief_record &record);

// replaces one key of a record as if it had been written that way, throws
// invalid_parameter when the result isn't a valid record
void override_record_field(relief_record &record, const std::string &key, const std::string &value);

relief_record load_relief_record(const std::string &path);
void save_relief_record(const std::string &path, const relief_record &record);

// where a tool puts the record for a result written to result_path
std::string record_path_for(const std::string &result_path);
