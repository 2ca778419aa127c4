#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "estate-forecast/core/calendar.hpp"
#include "estate-forecast/core/errors.hpp"
#include "estate-forecast/models/ensemble_tree.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

using estateforecast::models::EnsembleTreeBuilder;
namespace calendar = estateforecast::core::calendar;

TEST_CASE("EnsembleTree builder validates configuration", "[models][ensemble][builder]") {
	REQUIRE_THROWS_AS(EnsembleTreeBuilder().withTrees(0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(EnsembleTreeBuilder().withMaxDepth(-2).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(EnsembleTreeBuilder().withMinSamplesLeaf(0.0).build(), std::invalid_argument);

	auto model = EnsembleTreeBuilder().build();
	REQUIRE(model->getName() == "EnsembleTree");
}

TEST_CASE("EnsembleTree is deterministic for a fixed seed", "[models][ensemble]") {
	auto ts = tests::helpers::makeMonthlySeries("west", tests::helpers::seasonalValues(36));
	const auto future = calendar::monthStartsAfter(ts.lastTimestamp(), 6);

	auto first = EnsembleTreeBuilder().build();
	auto second = EnsembleTreeBuilder().build();
	first->fit(ts);
	second->fit(ts);
	REQUIRE(first->treeCount() == 100);
	REQUIRE(first->predict(future).point == second->predict(future).point);

	// Refitting the same instance reproduces the same forest.
	const auto before = first->predict(ts.getTimestamps()).point;
	first->fit(ts);
	REQUIRE(first->predict(ts.getTimestamps()).point == before);
}

TEST_CASE("EnsembleTree projects flat beyond the training range", "[models][ensemble][forecast]") {
	const auto values = tests::helpers::linearValues(24, 100.0, 1.0);
	auto ts = tests::helpers::makeMonthlySeries("flat", values);

	auto model = EnsembleTreeBuilder().build();
	model->fit(ts);

	const auto projection = model->predict(calendar::monthStartsAfter(ts.lastTimestamp(), 12));
	REQUIRE_FALSE(projection.hasInterval());
	for (const auto value : projection.point) {
		REQUIRE(value == Catch::Approx(projection.point.front()));
		REQUIRE(value >= values.front());
		REQUIRE(value <= values.back());
	}
}

TEST_CASE("EnsembleTree reproduces a constant series", "[models][ensemble]") {
	auto ts = tests::helpers::makeMonthlySeries("const", std::vector<double>(15, 250.0));

	auto model = EnsembleTreeBuilder().withTrees(10).build();
	model->fit(ts);
	const auto projection = model->predict(calendar::monthStartsAfter(ts.lastTimestamp(), 3));
	for (const auto value : projection.point) {
		REQUIRE(value == Catch::Approx(250.0));
	}
}

TEST_CASE("EnsembleTree requires two observations and a fit", "[models][ensemble][validation]") {
	auto model = EnsembleTreeBuilder().build();
	REQUIRE_THROWS_AS(model->predict(tests::helpers::makeMonthStarts(2)), std::runtime_error);

	auto single = tests::helpers::makeMonthlySeries("tiny", {100.0});
	REQUIRE_THROWS_AS(model->fit(single), estateforecast::core::InsufficientDataError);
}
