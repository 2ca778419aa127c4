#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "estate-forecast/core/calendar.hpp"
#include "estate-forecast/core/errors.hpp"
#include "estate-forecast/models/seasonal_trend.hpp"

#include <stdexcept>
#include <vector>

using estateforecast::models::SeasonalTrendBuilder;
namespace calendar = estateforecast::core::calendar;

TEST_CASE("SeasonalTrend builder validates hyperparameters", "[models][seasonal][builder]") {
	REQUIRE_THROWS_AS(SeasonalTrendBuilder().withFourierOrder(-1).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(SeasonalTrendBuilder().withPriorScale(0.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(SeasonalTrendBuilder().withIntervalWidth(1.0).build(), std::invalid_argument);

	auto model = SeasonalTrendBuilder().build();
	REQUIRE(model->getName() == "SeasonalTrend");
}

TEST_CASE("SeasonalTrend captures yearly seasonality", "[models][seasonal][forecast]") {
	const auto all = tests::helpers::seasonalValues(60);
	const std::vector<double> history(all.begin(), all.begin() + 48);
	auto ts = tests::helpers::makeMonthlySeries("coast", history);

	auto model = SeasonalTrendBuilder().build();
	model->fit(ts);
	REQUIRE(model->activeFourierOrder() == 3);

	const auto projection = model->predict(calendar::monthStartsAfter(ts.lastTimestamp(), 12));
	REQUIRE(projection.horizon() == 12);
	for (std::size_t h = 0; h < 12; ++h) {
		REQUIRE(projection.point[h] == Catch::Approx(all[48 + h]).margin(0.5));
	}
}

TEST_CASE("SeasonalTrend disables yearly terms on short histories", "[models][seasonal]") {
	auto ts = tests::helpers::makeMonthlySeries("short", tests::helpers::linearValues(18, 100.0, 1.0));

	auto model = SeasonalTrendBuilder().build();
	model->fit(ts);
	REQUIRE(model->activeFourierOrder() == 0);

	const auto projection = model->predict(calendar::monthStartsAfter(ts.lastTimestamp(), 3));
	REQUIRE(projection.point[0] == Catch::Approx(118.0));
	REQUIRE(projection.point[2] == Catch::Approx(120.0));
}

TEST_CASE("SeasonalTrend interval widens with the horizon", "[models][seasonal][interval]") {
	auto values = tests::helpers::seasonalValues(40);
	for (std::size_t i = 0; i < values.size(); ++i) {
		values[i] += (i % 2 == 0) ? 1.5 : -1.5;
	}
	auto ts = tests::helpers::makeMonthlySeries("noisy", values);

	auto model = SeasonalTrendBuilder().build();
	model->fit(ts);
	REQUIRE(model->residualStd() > 0.0);

	const auto projection = model->predict(calendar::monthStartsAfter(ts.lastTimestamp(), 6));
	REQUIRE(projection.hasInterval());

	const auto &lower = projection.lowerSeries();
	const auto &upper = projection.upperSeries();
	double previous_width = 0.0;
	for (std::size_t h = 0; h < projection.horizon(); ++h) {
		REQUIRE(lower[h] < projection.point[h]);
		REQUIRE(projection.point[h] < upper[h]);
		const double width = upper[h] - lower[h];
		REQUIRE(width > previous_width);
		previous_width = width;
	}
}

TEST_CASE("SeasonalTrend requires two observations and a fit", "[models][seasonal][validation]") {
	auto model = SeasonalTrendBuilder().build();
	REQUIRE_THROWS_AS(model->predict(tests::helpers::makeMonthStarts(2)), std::runtime_error);

	auto single = tests::helpers::makeMonthlySeries("tiny", {100.0});
	REQUIRE_THROWS_AS(model->fit(single), estateforecast::core::InsufficientDataError);
}
