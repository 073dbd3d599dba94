#pragma once

#include <ostream>

// from opencascade
#include <TopoDS_Shape.hxx>
#include <BRepCheck_Status.hxx>
#include <BRepAlgoAPI_BooleanOperation.hxx>


std::ostream& operator<<(std::ostream& str, TopAbs_ShapeEnum type);
std::ostream& operator<<(std::ostream& str, BRepCheck_Status type);
std::ostream& operator<<(std::ostream& str, BOPAlgo_Operation op);


double volume_of_shape(const class TopoDS_Shape& shape);
double area_of_shape(const TopoDS_Shape& shape);

bool shape_has_solids(const TopoDS_Shape& shape);

// logs any BRepCheck errors against the label given
bool is_shape_valid(const char *label, const TopoDS_Shape& shape);

class boolean_op : public BRepAlgoAPI_BooleanOperation
{
public:
	boolean_op(
		const BOPAlgo_Operation op,
		const TopoDS_Shape& shape,
		const TopoDS_Shape& tool) {
		init(op, shape, tool);
	}

protected:
	void init(
		const BOPAlgo_Operation op,
		const TopoDS_Shape& shape,
		const TopoDS_Shape& tool)	{
		myOperation = op;
		myArguments.Append(shape);
		myTools.Append(tool);
		SetRunParallel(false);
		SetNonDestructive(true);
	}
};

// runs a single boolean between shape and tool. throws
// boolean_operation_failed carrying OCCT's error alerts when the kernel
// rejects it, the inputs are never modified
TopoDS_Shape perform_boolean(
	BOPAlgo_Operation op,
	const TopoDS_Shape& shape, const TopoDS_Shape& tool,
	const char *what);
