#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <TopoDS_Shape.hxx>


enum class qr_error_correction {
	low,
	medium,
	quartile,
	high,
};

// accepts "L", "M", "Q" or "H", anything else logs a warning and gives medium
qr_error_correction parse_error_correction(const std::string &label);
const char *error_correction_label(qr_error_correction level);

// square grid of modules, true is dark. includes the quiet zone when it came
// from a module source
class qr_module_matrix {
	int size_;
	std::vector<char> modules;

public:
	explicit qr_module_matrix(int n = 0) :
		size_{n}, modules((size_t)n * n, 0) {}

	int size() const {
		return size_;
	}

	bool at(int row, int col) const {
		return modules[(size_t)row * size_ + col] != 0;
	}

	void set(int row, int col, bool dark) {
		modules[(size_t)row * size_ + col] = dark;
	}

	size_t count_dark() const;
};

// encodes text and surrounds it with border light modules on every side
using qr_module_source = std::function<
	qr_module_matrix(const std::string &text, qr_error_correction level, int border)>;

// module source backed by libqrencode
qr_module_source libqrencode_module_source();

// QR version implied by a matrix with the given quiet zone
int qr_version_of(const qr_module_matrix &matrix, int border);

// maximal horizontal run of dark modules in one row
struct module_run {
	int row, col, length;
};

// runs in row order, left to right within a row
std::vector<module_run> merge_row_runs(const qr_module_matrix &matrix);

/* one rectangle face per run, the code centred on the origin with row 0 at
 * the top (+Y) and each module size/n wide. the faces are extruded together
 * from Z=-overlap to Z=height+overlap so the result straddles the target
 * surface.  returns nothing if the matrix has no dark modules
 */
std::optional<TopoDS_Shape> make_qr_solid(
	const qr_module_matrix &matrix, double size, double height, double overlap = 0.01);
