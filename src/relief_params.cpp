#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <vector>

#ifdef INCLUDE_TESTS
#include <filesystem>
#include <catch2/catch_test_macros.hpp>
#endif

#include <aixlog.hpp>

#include "errors.hpp"
#include "relief_params.hpp"
#include "utils.hpp"


const char *
record_kind(const relief_record &record)
{
	switch (record.params.index()) {
	case 0: return "logo";
	case 1: return "logotext";
	case 2: return "qr";
	}
	return "unknown";
}

// shortest of 15 or 17 significant digits that reads back exactly
static std::string
format_double(double val)
{
	for (int precision : {15, 17}) {
		std::stringstream ss;
		ss << std::setprecision(precision) << val;
		if (std::strtod(ss.str().c_str(), nullptr) == val || precision == 17) {
			return ss.str();
		}
	}
	return {};
}

// key/value pairs of a record, each key may be taken once
class record_fields {
	std::map<std::string, std::string> values;

	std::string take(const char *key) {
		const auto it = values.find(key);
		if (it == values.end()) {
			throw invalid_parameter(std::string("relief record is missing ") + key);
		}
		auto val = it->second;
		values.erase(it);
		return val;
	}

public:
	void add(const std::string &key, const std::string &value) {
		if (!values.emplace(key, value).second) {
			throw invalid_parameter("relief record repeats " + key);
		}
	}

	bool has(const char *key) const {
		return values.count(key) > 0;
	}

	std::string take_string(const char *key) {
		return take(key);
	}

	double take_double(const char *key) {
		const auto str = take(key);
		double val;
		if (!double_of_string(str.c_str(), val)) {
			throw invalid_parameter(std::string("unable to parse ") + key + " '" + str + "' as a number");
		}
		return val;
	}

	double take_double(const char *key, double fallback) {
		return has(key) ? take_double(key) : fallback;
	}

	int take_int(const char *key) {
		const auto str = take(key);
		int val;
		if (!int_of_string(str.c_str(), val, 10)) {
			throw invalid_parameter(std::string("unable to parse ") + key + " '" + str + "' as an integer");
		}
		return val;
	}

	bool take_bool(const char *key) {
		const auto str = take(key);
		if (str == "true" || str == "1") {
			return true;
		} else if (str == "false" || str == "0") {
			return false;
		}
		throw invalid_parameter(std::string("unable to parse ") + key + " '" + str + "' as true/false");
	}

	void check_all_taken() const {
		if (!values.empty()) {
			throw invalid_parameter("unknown key in relief record: " + values.begin()->first);
		}
	}
};

static logo_params
take_logo_params(record_fields &fields)
{
	logo_params p;
	p.diameter = fields.take_double("diameter");
	p.total_depth = fields.take_double("total_depth");
	p.mountain_ratio = fields.take_double("mountain_ratio");
	p.trail_ratio = fields.take_double("trail_ratio");
	p.bolt_ratio = fields.take_double("bolt_ratio");
	p.x_offset = fields.take_double("x_offset", 0);
	p.y_offset = fields.take_double("y_offset", 0);
	p.rotation = fields.take_double("rotation", 0);
	return p;
}

static qr_params
take_qr_params(record_fields &fields)
{
	qr_params p;
	p.url = fields.take_string("url");
	p.size = fields.take_double("size");
	p.height = fields.take_double("height");
	p.emboss = fields.take_bool("emboss");
	p.error_correction = fields.take_string("error_correction");
	p.border = fields.take_int("border");
	p.x_offset = fields.take_double("x_offset", 0);
	p.y_offset = fields.take_double("y_offset", 0);
	return p;
}

relief_record
read_relief_record(std::istream &is)
{
	std::vector<std::string> row;
	std::string kind;
	record_fields fields;

	int line = 0;
	while (true) {
		const auto status = parse_next_row(is, row);
		if (status == input_status::end_of_file) {
			break;
		} else if (status == input_status::error) {
			throw invalid_parameter("error reading relief record");
		}
		line += 1;

		if (row.size() == 1 && row[0].empty()) {
			continue;
		}
		if (row.size() != 2) {
			std::stringstream msg;
			msg << "relief record line " << line << " has " << row.size() << " fields, expected 2";
			throw invalid_parameter(msg.str());
		}
		if (kind.empty()) {
			if (row[0] != "kind") {
				throw invalid_parameter("relief record must start with its kind");
			}
			kind = row[1];
			continue;
		}
		fields.add(row[0], row[1]);
	}

	relief_record record;
	if (kind == "logo") {
		record.params = take_logo_params(fields);
	} else if (kind == "logotext") {
		logotext_params p;
		p.text = fields.take_string("text");
		p.text_ratio = fields.take_double("text_ratio");
		p.logo = take_logo_params(fields);
		record.params = p;
	} else if (kind == "qr") {
		record.params = take_qr_params(fields);
	} else if (kind.empty()) {
		throw invalid_parameter("relief record is empty");
	} else {
		throw invalid_parameter("unknown relief kind '" + kind + "'");
	}

	record.body_id = fields.take_string("body");
	record.face_id = fields.take_string("face");

	fields.check_all_taken();

	return record;
}

static void
write_logo_rows(std::ostream &os, const logo_params &p)
{
	write_csv_row(os, {"diameter", format_double(p.diameter)});
	write_csv_row(os, {"total_depth", format_double(p.total_depth)});
	write_csv_row(os, {"mountain_ratio", format_double(p.mountain_ratio)});
	write_csv_row(os, {"trail_ratio", format_double(p.trail_ratio)});
	write_csv_row(os, {"bolt_ratio", format_double(p.bolt_ratio)});
	write_csv_row(os, {"x_offset", format_double(p.x_offset)});
	write_csv_row(os, {"y_offset", format_double(p.y_offset)});
	write_csv_row(os, {"rotation", format_double(p.rotation)});
}

void
write_relief_record(std::ostream &os, const relief_record &record)
{
	write_csv_row(os, {"kind", record_kind(record)});
	write_csv_row(os, {"body", record.body_id});
	write_csv_row(os, {"face", record.face_id});

	if (const auto *p = std::get_if<logo_params>(&record.params)) {
		write_logo_rows(os, *p);
	} else if (const auto *p = std::get_if<logotext_params>(&record.params)) {
		write_logo_rows(os, p->logo);
		write_csv_row(os, {"text", p->text});
		write_csv_row(os, {"text_ratio", format_double(p->text_ratio)});
	} else if (const auto *p = std::get_if<qr_params>(&record.params)) {
		write_csv_row(os, {"url", p->url});
		write_csv_row(os, {"size", format_double(p->size)});
		write_csv_row(os, {"height", format_double(p->height)});
		write_csv_row(os, {"emboss", p->emboss ? "true" : "false"});
		write_csv_row(os, {"error_correction", p->error_correction});
		write_csv_row(os, {"border", std::to_string(p->border)});
		write_csv_row(os, {"x_offset", format_double(p->x_offset)});
		write_csv_row(os, {"y_offset", format_double(p->y_offset)});
	}
}

void
override_record_field(relief_record &record, const std::string &key, const std::string &value)
{
	if (key == "kind") {
		throw invalid_parameter("the kind of a relief can't be changed");
	}

	std::stringstream written;
	write_relief_record(written, record);

	std::stringstream edited;
	std::vector<std::string> row;
	bool found = false;
	while (parse_next_row(written, row) == input_status::success) {
		if (row.size() == 2 && row[0] == key) {
			row[1] = value;
			found = true;
		}
		write_csv_row(edited, row);
	}
	if (!found) {
		write_csv_row(edited, {key, value});
	}

	record = read_relief_record(edited);
}

relief_record
load_relief_record(const std::string &path)
{
	std::ifstream is{path};
	if (!is) {
		throw relief_error("unable to open relief record " + path);
	}
	return read_relief_record(is);
}

void
save_relief_record(const std::string &path, const relief_record &record)
{
	std::ofstream os{path};
	if (!os) {
		throw relief_error("unable to write relief record " + path);
	}
	write_relief_record(os, record);
	os.close();
	if (os.fail()) {
		throw relief_error("error writing relief record " + path);
	}
	LOG(DEBUG) << "wrote " << record_kind(record) << " record to " << path << '\n';
}

std::string
record_path_for(const std::string &result_path)
{
	return result_path + ".relief.csv";
}

#ifdef INCLUDE_TESTS
static relief_record
written_and_read(const relief_record &record)
{
	std::stringstream ss;
	write_relief_record(ss, record);
	return read_relief_record(ss);
}

TEST_CASE("relief records") {
	SECTION("logotext keeps everything") {
		logotext_params p;
		p.logo.diameter = 24.5;
		p.logo.total_depth = 0.1 + 0.2;
		p.logo.rotation = -30;
		p.text = "Trail Current, \"inc\"";
		p.text_ratio = 0.75;

		const auto rec = written_and_read({p, "/tmp/some body.brep", "Face6"});

		CHECK(std::string(record_kind(rec)) == "logotext");
		CHECK(rec.body_id == "/tmp/some body.brep");
		CHECK(rec.face_id == "Face6");

		const auto &q = std::get<logotext_params>(rec.params);
		CHECK(q.logo.diameter == 24.5);
		CHECK(q.logo.total_depth == 0.1 + 0.2);
		CHECK(q.logo.rotation == -30);
		CHECK(q.logo.mountain_ratio == 0.55);
		CHECK(q.text == p.text);
		CHECK(q.text_ratio == 0.75);
	}

	SECTION("qr parameters") {
		qr_params p;
		p.url = "https://example.com/?a=1,b=2";
		p.emboss = false;
		p.error_correction = "H";
		p.border = 4;

		const auto rec = written_and_read({p, "plate.brep", "Face2"});
		const auto &q = std::get<qr_params>(rec.params);
		CHECK(q.url == p.url);
		CHECK_FALSE(q.emboss);
		CHECK(q.error_correction == "H");
		CHECK(q.border == 4);
		CHECK(q.size == 20);
	}

	SECTION("payload containing newlines") {
		qr_params p;
		p.url = "WIFI:S:home;\nT:WPA;P:secret;;";

		const auto rec = written_and_read({p, "plate.brep", "Face2"});
		CHECK(std::get<qr_params>(rec.params).url == p.url);
		CHECK(rec.body_id == "plate.brep");
		CHECK(rec.face_id == "Face2");
	}

	SECTION("offsets and rotation are optional") {
		std::stringstream ss{
			"kind,logo\n"
			"body,cube.brep\n"
			"face,Face1\n"
			"diameter,18\n"
			"total_depth,0.8\n"
			"mountain_ratio,0.5\n"
			"trail_ratio,0.25\n"
			"bolt_ratio,0.1\n"
			"\n"};
		const auto rec = read_relief_record(ss);
		const auto &p = std::get<logo_params>(rec.params);
		CHECK(p.mountain_ratio == 0.5);
		CHECK(p.x_offset == 0);
		CHECK(p.y_offset == 0);
		CHECK(p.rotation == 0);
	}

	SECTION("malformed records") {
		auto read = [](const char *text) {
			std::stringstream ss{text};
			return read_relief_record(ss);
		};
		CHECK_THROWS_AS(read(""), invalid_parameter);
		CHECK_THROWS_AS(read("kind,sphere\n"), invalid_parameter);
		CHECK_THROWS_AS(read("body,a.brep\nkind,logo\n"), invalid_parameter);
		CHECK_THROWS_AS(read(
			"kind,qr\nbody,a\nface,Face1\nurl,x\nsize,big\nheight,1\n"
			"emboss,true\nerror_correction,M\nborder,2\n"), invalid_parameter);
		CHECK_THROWS_AS(read(
			"kind,qr\nbody,a\nface,Face1\nurl,x\nsize,20\nheight,1\n"
			"emboss,true\nerror_correction,M\nborder,2\ncolour,red\n"), invalid_parameter);
		CHECK_THROWS_AS(read(
			"kind,qr\nbody,a\nface,Face1\nurl,x\nsize,20\nsize,20\n"), invalid_parameter);
	}

	SECTION("overriding a field") {
		relief_record rec{logo_params{}, "cube.brep", "Face6"};
		override_record_field(rec, "total_depth", "1.5");
		override_record_field(rec, "face", "Face2");
		CHECK(std::get<logo_params>(rec.params).total_depth == 1.5);
		CHECK(std::get<logo_params>(rec.params).diameter == 18);
		CHECK(rec.face_id == "Face2");

		CHECK_THROWS_AS(override_record_field(rec, "url", "x"), invalid_parameter);
		CHECK_THROWS_AS(override_record_field(rec, "diameter", "wide"), invalid_parameter);
		CHECK_THROWS_AS(override_record_field(rec, "kind", "qr"), invalid_parameter);
	}

	SECTION("record files") {
		namespace fs = std::filesystem;
		const auto dir = fs::temp_directory_path() / "face_relief_record_test";
		fs::create_directories(dir);
		const auto path = (dir / "plate.brep.relief.csv").string();

		qr_params p;
		p.url = "https://example.com";
		save_relief_record(path, {p, "/tmp/plate.brep", "Face2"});
		const auto rec = load_relief_record(path);
		CHECK(std::get<qr_params>(rec.params).url == p.url);
		CHECK(rec.face_id == "Face2");

		const auto missing = (dir / "missing.csv").string();
		CHECK_THROWS_WITH(load_relief_record(missing), "unable to open relief record " + missing);
		const auto unwritable = (dir / "no_dir" / "out.csv").string();
		CHECK_THROWS_WITH(
			save_relief_record(unwritable, rec), "unable to write relief record " + unwritable);

		fs::remove_all(dir);
	}

	CHECK(record_path_for("out.brep") == "out.brep.relief.csv");
}
#endif
