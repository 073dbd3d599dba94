#pragma once

#include <string>
#include <vector>

#include <TopoDS_Shape.hxx>


// one region of a relief with its own depth. lower priority numbers are
// drawn on top, i.e. they are the shallowest
struct relief_layer {
	std::string name;
	TopoDS_Shape shape;
	double depth;
	int priority;
};

/* returns the layers sorted by priority, each with every layer of strictly
 * lower priority number subtracted from it. the results are pairwise
 * disjoint and together cover the same region as the inputs. subtraction
 * uses the original shapes, not the already isolated ones
 */
std::vector<relief_layer> isolate_layers(std::vector<relief_layer> layers);
