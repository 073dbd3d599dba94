#include <algorithm>
#include <utility>

#ifdef INCLUDE_TESTS
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#endif

#include <aixlog.hpp>

#include "geometry.hpp"
#include "layer_isolator.hpp"


std::vector<relief_layer>
isolate_layers(std::vector<relief_layer> layers)
{
	std::stable_sort(
		layers.begin(), layers.end(),
		[](const relief_layer &a, const relief_layer &b) {
			return a.priority < b.priority;
		});

	std::vector<relief_layer> isolated;
	isolated.reserve(layers.size());

	for (size_t i = 0; i < layers.size(); i++) {
		relief_layer layer = layers[i];
		for (size_t j = 0; j < i; j++) {
			if (layers[j].priority == layer.priority) {
				continue;
			}
			layer.shape = perform_boolean(
				BOPAlgo_CUT, layer.shape, layers[j].shape, layer.name.c_str());
		}
		LOG(TRACE) << "isolated layer " << layer.name << " against " << i << " above it\n";
		isolated.push_back(std::move(layer));
	}

	return isolated;
}

#ifdef INCLUDE_TESTS
#include "shape2d.hpp"

TEST_CASE("isolate_layers") {
	using Catch::Approx;

	// nested squares plus one sticking out of the others
	const auto big = make_polygon_face({{-4, -4}, {4, -4}, {4, 4}, {-4, 4}});
	const auto mid = make_polygon_face({{-2, -2}, {2, -2}, {2, 2}, {-2, 2}});
	const auto bar = make_polygon_face({{-1, -6}, {1, -6}, {1, 6}, {-1, 6}});

	// given out of order on purpose
	const auto layers = isolate_layers({
		{"big", big, 1.0, 2},
		{"bar", bar, 0.2, 0},
		{"mid", mid, 0.5, 1},
	});

	REQUIRE(layers.size() == 3);
	CHECK(layers[0].name == "bar");
	CHECK(layers[1].name == "mid");
	CHECK(layers[2].name == "big");
	CHECK(layers[2].depth == 1.0);

	CHECK(area_of_shape(layers[0].shape) == Approx(2 * 12));
	CHECK(area_of_shape(layers[1].shape) == Approx(16 - 2 * 4));
	CHECK(area_of_shape(layers[2].shape) == Approx(64 - 16 - 2 * 4));

	SECTION("layers are pairwise disjoint") {
		for (size_t i = 0; i < layers.size(); i++) {
			for (size_t j = i + 1; j < layers.size(); j++) {
				const auto common = perform_boolean(
					BOPAlgo_COMMON, layers[i].shape, layers[j].shape, "test");
				CHECK(area_of_shape(common) == Approx(0).margin(1e-9));
			}
		}
	}

	SECTION("union is unchanged") {
		const auto before = fuse_all({big, mid, bar}, "test");
		const auto after = fuse_all({layers[0].shape, layers[1].shape, layers[2].shape}, "test");
		CHECK(area_of_shape(after) == Approx(area_of_shape(before)));
	}
}
#endif
