#pragma once

#include <string>

// from opencascade
#include <Poly_Triangulation.hxx>
#include <TopoDS_Face.hxx>
#include <TopoDS_Shape.hxx>
#include <TopTools_IndexedMapOfShape.hxx>


// a loaded model, resolved once into what it can do. relief operations need
// a solid shape, mesh export is happy with either
struct input_model {
	bool has_solid_shape, has_mesh;

	TopoDS_Shape shape;
	Handle(Poly_Triangulation) mesh;
};

// loads .brep (solid) or .stl (mesh), decided by the file extension
input_model load_input_model(const std::string &path);

struct document {
	// identifies the body when a record is written, currently the path it
	// was loaded from
	std::string body_id;

	TopoDS_Shape shape;

	// unique faces in exploration order, indexed from 1 like "Face1"
	TopTools_IndexedMapOfShape faces;

	void load_brep_file(const char* path);
	void write_brep_file(const char* path) const;

	void set_shape(const TopoDS_Shape &shape);

	// accepts "FaceN" or a plain index, returns 0 if invalid
	int lookup_face(const std::string &str) const;

	// throws invalid_parameter when the face can't be found
	TopoDS_Face face(const std::string &str) const;

	static std::string face_name(int index);
};
