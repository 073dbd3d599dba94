#include <cerrno>
#include <cstring>
#include <memory>
#include <sstream>

#ifdef INCLUDE_TESTS
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#endif

#include <BRepBuilderAPI_Transform.hxx>
#include <BRepPrimAPI_MakePrism.hxx>
#include <BRep_Builder.hxx>
#include <TopoDS_Compound.hxx>
#include <gp_Trsf.hxx>
#include <gp_Vec.hxx>

#include <qrencode.h>

#include <aixlog.hpp>

#include "errors.hpp"
#include "qr_matrix.hpp"
#include "shape2d.hpp"


qr_error_correction
parse_error_correction(const std::string &label)
{
	if (label == "L") {
		return qr_error_correction::low;
	} else if (label == "M") {
		return qr_error_correction::medium;
	} else if (label == "Q") {
		return qr_error_correction::quartile;
	} else if (label == "H") {
		return qr_error_correction::high;
	}

	LOG(WARNING) << "unknown error correction level '" << label << "', using M\n";
	return qr_error_correction::medium;
}

const char *
error_correction_label(qr_error_correction level)
{
	switch (level) {
	case qr_error_correction::low: return "L";
	case qr_error_correction::medium: return "M";
	case qr_error_correction::quartile: return "Q";
	case qr_error_correction::high: return "H";
	}
	return "M";
}

size_t
qr_module_matrix::count_dark() const
{
	size_t n = 0;
	for (const char m : modules) {
		if (m) {
			n += 1;
		}
	}
	return n;
}

static QRecLevel
qrencode_level(qr_error_correction level)
{
	switch (level) {
	case qr_error_correction::low: return QR_ECLEVEL_L;
	case qr_error_correction::medium: return QR_ECLEVEL_M;
	case qr_error_correction::quartile: return QR_ECLEVEL_Q;
	case qr_error_correction::high: return QR_ECLEVEL_H;
	}
	return QR_ECLEVEL_M;
}

static qr_module_matrix
encode_with_libqrencode(const std::string &text, qr_error_correction level, int border)
{
	if (text.empty()) {
		throw empty_matrix("no text to encode");
	}
	if (border < 0) {
		throw invalid_parameter("QR border can't be negative");
	}

	errno = 0;
	std::unique_ptr<QRcode, decltype(&QRcode_free)> code{
		QRcode_encodeString(text.c_str(), 0, qrencode_level(level), QR_MODE_8, 1),
		&QRcode_free};

	if (!code) {
		std::stringstream msg;
		msg << "libqrencode unable to encode text";
		if (errno == ERANGE) {
			msg << ", too long for any QR version";
		} else if (errno != 0) {
			msg << ", " << std::strerror(errno);
		}
		throw empty_matrix(msg.str());
	}

	const int width = code->width;
	qr_module_matrix matrix{width + 2 * border};
	for (int row = 0; row < width; row++) {
		for (int col = 0; col < width; col++) {
			// bit 0 of each byte is the module colour, the rest is metadata
			const bool dark = code->data[(size_t)row * width + col] & 1;
			matrix.set(row + border, col + border, dark);
		}
	}
	return matrix;
}

qr_module_source
libqrencode_module_source()
{
	return encode_with_libqrencode;
}

int
qr_version_of(const qr_module_matrix &matrix, int border)
{
	return (matrix.size() - 2 * border - 17) / 4 + 1;
}

std::vector<module_run>
merge_row_runs(const qr_module_matrix &matrix)
{
	const int n = matrix.size();

	std::vector<module_run> runs;
	for (int row = 0; row < n; row++) {
		int col = 0;
		while (col < n) {
			if (!matrix.at(row, col)) {
				col += 1;
				continue;
			}
			const int start = col;
			while (col < n && matrix.at(row, col)) {
				col += 1;
			}
			runs.push_back({row, start, col - start});
		}
	}
	return runs;
}

std::optional<TopoDS_Shape>
make_qr_solid(
	const qr_module_matrix &matrix, double size, double height, double overlap)
{
	if (!(size > 0) || !(height > 0) || overlap < 0) {
		throw invalid_parameter("QR size and height must be positive");
	}

	const auto runs = merge_row_runs(matrix);
	if (runs.empty()) {
		return std::nullopt;
	}

	const int n = matrix.size();
	const double
		module_size = size / n,
		half = size / 2;

	BRep_Builder builder;
	TopoDS_Compound faces;
	builder.MakeCompound(faces);

	for (const auto &run : runs) {
		const double
			x1 = -half + run.col * module_size,
			x2 = x1 + run.length * module_size,
			y2 = half - run.row * module_size,
			y1 = y2 - module_size;

		builder.Add(faces, make_polygon_face({{x1, y1}, {x2, y1}, {x2, y2}, {x1, y2}}));
	}

	gp_Trsf lower;
	lower.SetTranslation(gp_Vec(0, 0, -overlap));
	const auto base = BRepBuilderAPI_Transform(faces, lower, true).Shape();

	BRepPrimAPI_MakePrism prism{base, gp_Vec(0, 0, height + 2 * overlap)};
	if (!prism.IsDone()) {
		throw relief_error("unable to extrude QR modules");
	}

	LOG(DEBUG)
		<< "merged " << matrix.count_dark() << " dark modules into "
		<< runs.size() << " rectangles\n";

	return prism.Shape();
}

#ifdef INCLUDE_TESTS
#include "geometry.hpp"

static qr_module_matrix
matrix_of_rows(const std::vector<std::string> &rows)
{
	qr_module_matrix m{(int)rows.size()};
	for (size_t r = 0; r < rows.size(); r++) {
		for (size_t c = 0; c < rows[r].size(); c++) {
			m.set((int)r, (int)c, rows[r][c] == '#');
		}
	}
	return m;
}

TEST_CASE("error correction labels") {
	CHECK(parse_error_correction("L") == qr_error_correction::low);
	CHECK(parse_error_correction("H") == qr_error_correction::high);
	CHECK(parse_error_correction("X") == qr_error_correction::medium);
	CHECK(parse_error_correction("") == qr_error_correction::medium);

	for (auto level : {
			qr_error_correction::low, qr_error_correction::medium,
			qr_error_correction::quartile, qr_error_correction::high}) {
		CHECK(parse_error_correction(error_correction_label(level)) == level);
	}
}

TEST_CASE("merge_row_runs") {
	const auto m = matrix_of_rows({
		"##.#",
		"....",
		"####",
		".#.#",
	});

	const auto runs = merge_row_runs(m);
	REQUIRE(runs.size() == 5);
	CHECK(runs[0].row == 0);
	CHECK(runs[0].col == 0);
	CHECK(runs[0].length == 2);
	CHECK(runs[2].row == 2);
	CHECK(runs[2].length == 4);

	SECTION("runs cover exactly the dark modules") {
		qr_module_matrix rebuilt{m.size()};
		size_t covered = 0;
		for (const auto &run : runs) {
			for (int c = run.col; c < run.col + run.length; c++) {
				CHECK_FALSE(rebuilt.at(run.row, c));
				rebuilt.set(run.row, c, true);
				covered += 1;
			}
		}
		CHECK(covered == m.count_dark());
		for (int r = 0; r < m.size(); r++) {
			for (int c = 0; c < m.size(); c++) {
				CHECK(rebuilt.at(r, c) == m.at(r, c));
			}
		}
	}
}

TEST_CASE("make_qr_solid") {
	using Catch::Approx;

	const auto m = matrix_of_rows({
		"#...#",
		".###.",
		"..#..",
		".....",
		"#####",
	});
	const double size = 10, height = 0.5, overlap = 0.01;
	const double ms = size / m.size();

	const auto solid = make_qr_solid(m, size, height, overlap);
	REQUIRE(solid);

	CHECK(volume_of_shape(*solid) == Approx(m.count_dark() * ms * ms * (height + 2 * overlap)));

	const auto b = shape_bounds(*solid);
	// top left module is dark, so is the whole bottom row
	CHECK(b.xmin == Approx(-size / 2).margin(1e-5));
	CHECK(b.ymax == Approx(size / 2).margin(1e-5));
	CHECK(b.ymin == Approx(-size / 2).margin(1e-5));

	SECTION("nothing dark, nothing built") {
		CHECK_FALSE(make_qr_solid(qr_module_matrix{21}, size, height));
	}
}

TEST_CASE("libqrencode module source") {
	const int border = 2;
	const auto source = libqrencode_module_source();
	const auto m = source("https://example.com", qr_error_correction::medium, border);

	const int n = m.size();
	REQUIRE((n - 2 * border - 17) % 4 == 0);
	CHECK(qr_version_of(m, border) >= 1);

	// quiet zone is light all round
	for (int i = 0; i < n; i++) {
		for (int b = 0; b < border; b++) {
			CHECK_FALSE(m.at(b, i));
			CHECK_FALSE(m.at(n - 1 - b, i));
			CHECK_FALSE(m.at(i, b));
			CHECK_FALSE(m.at(i, n - 1 - b));
		}
	}

	// corner of the top left finder pattern
	CHECK(m.at(border, border));
	CHECK(m.at(border + 6, border + 6));
	CHECK_FALSE(m.at(border + 1, border + 1));

	CHECK_THROWS_AS(source("", qr_error_correction::medium, border), empty_matrix);
}
#endif
