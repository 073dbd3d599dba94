#pragma once

#include <TopoDS_Face.hxx>
#include <TopoDS_Shape.hxx>

#include "document.hpp"
#include "qr_matrix.hpp"
#include "relief_params.hpp"


// collaborators the relief operations depend on, decided once at start up
struct relief_config {
	// empty when no QR encoder is available
	qr_module_source qr_source;
};

relief_config default_relief_config();

// QR modules smaller than this are hard to print or scan
const double qr_min_module_size = 0.3;

/* each operation takes the base body and one of its planar faces and
 * returns a new body, base is never modified. the face must belong to base.
 * failures throw a relief_error subclass and nothing is returned
 */

// circle, mountain, trail and bolt cut into the face, each to its own depth
TopoDS_Shape apply_logo(
	const TopoDS_Shape &base, const TopoDS_Face &face, const logo_params &params);

// the logo plus text to its right
TopoDS_Shape apply_logotext(
	const TopoDS_Shape &base, const TopoDS_Face &face, const logotext_params &params);

struct qr_result {
	TopoDS_Shape shape;

	// side of one module, so the caller can judge if it'll print and scan
	double module_size_mm;
	// modules per side including the quiet zone
	int modules;
	int version;
};

qr_result apply_qr(
	const relief_config &config,
	const TopoDS_Shape &base, const TopoDS_Face &face, const qr_params &params);

// reruns whichever operation the record describes against the body in doc,
// the face is resolved from record.face_id
TopoDS_Shape apply_record(
	const relief_config &config, const document &doc, const relief_record &record);
