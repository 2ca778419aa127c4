#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/forecaster_fixtures.hpp"
#include "common/series_helpers.hpp"
#include "estate-forecast/analysis/district_analyzer.hpp"
#include "estate-forecast/core/errors.hpp"
#include "estate-forecast/validation/backtester.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

using estateforecast::analysis::AnalysisConfig;
using estateforecast::analysis::DistrictAnalysisError;
using estateforecast::analysis::DistrictAnalyzer;
using estateforecast::analysis::DistrictReport;
using estateforecast::analysis::FailureReason;
using estateforecast::models::kAllModelKinds;
using estateforecast::models::ModelKind;

TEST_CASE("Linear history selects the linear model", "[analysis][district]") {
	auto ts = tests::helpers::makeMonthlySeries("north", tests::helpers::linearValues(48, 100.0, 1.0));

	const DistrictAnalyzer analyzer;
	const auto outcome = analyzer.analyzeOrThrow(ts);
	const auto &report = outcome.report;

	REQUIRE(report.district == "north");
	REQUIRE(report.current_price == 147.0);
	REQUIRE(report.last_date == ts.lastTimestamp());
	REQUIRE(report.horizon == 12);
	REQUIRE(report.best_model == ModelKind::LinearTrend);
	REQUIRE(report.errorOf(ModelKind::LinearTrend) == Catch::Approx(0.0).margin(1e-6));

	const double expected = (159.0 - 147.0) / 147.0 * 100.0;
	REQUIRE(report.returnOf(ModelKind::LinearTrend) == Catch::Approx(expected));
	REQUIRE(report.expectedReturn() == Catch::Approx(expected));
	REQUIRE(report.futureIndex(ModelKind::LinearTrend) == Catch::Approx(159.0));
}

TEST_CASE("Returns derive from the last projected value", "[analysis][district]") {
	auto ts = tests::helpers::makeMonthlySeries("coast", tests::helpers::seasonalValues(66));

	const DistrictAnalyzer analyzer(AnalysisConfig::Builder().withHorizon(9).build());
	const auto outcome = analyzer.analyzeOrThrow(ts);
	const auto &report = outcome.report;
	const auto &bundle = outcome.bundle;

	REQUIRE(bundle.history.size() == ts.size());
	REQUIRE(bundle.future_dates.size() == 9);
	REQUIRE(bundle.windows.size() == 3);
	REQUIRE(bundle.errors == report.errors);

	double minimum = report.errors.begin()->second;
	for (const auto kind : kAllModelKinds) {
		const double last = bundle.projections.at(kind).last();
		REQUIRE(report.returnOf(kind) == Catch::Approx((last - report.current_price) / report.current_price * 100.0));
		REQUIRE(bundle.in_sample.at(kind).horizon() == ts.size());
		minimum = std::min(minimum, report.errorOf(kind));
	}
	REQUIRE(report.errorOf(report.best_model) <= minimum + DistrictAnalyzer::kTieTolerance);
}

TEST_CASE("Histories without backtest windows fall back to the linear model", "[analysis][district][edge]") {
	auto ts = tests::helpers::makeMonthlySeries("young", tests::helpers::seasonalValues(20));

	const DistrictAnalyzer analyzer;
	const auto result = analyzer.analyze(ts);
	REQUIRE(result.ok());

	const auto &report = result.report();
	for (const auto kind : kAllModelKinds) {
		REQUIRE(report.errorOf(kind) == estateforecast::validation::Backtester::kSentinelError);
		REQUIRE(report.errorLabel(kind) == "99.90%");
	}
	REQUIRE(report.best_model == ModelKind::LinearTrend);
}

TEST_CASE("Districts with under a year of history are excluded", "[analysis][district][edge]") {
	auto ts = tests::helpers::makeMonthlySeries("tiny", tests::helpers::linearValues(10));

	const DistrictAnalyzer analyzer;
	REQUIRE_THROWS_AS(analyzer.analyzeOrThrow(ts), estateforecast::core::InsufficientHistoryError);

	const auto result = analyzer.analyze(ts);
	REQUIRE_FALSE(result.ok());
	REQUIRE(result.district() == "tiny");
	REQUIRE(result.error().reason() == FailureReason::InsufficientHistory);
	REQUIRE(result.error().district() == "tiny");
	REQUIRE_THROWS_AS(result.report(), DistrictAnalysisError);
}

TEST_CASE("Successful results expose no error", "[analysis][district]") {
	auto ts = tests::helpers::makeMonthlySeries("ok", tests::helpers::linearValues(12));

	const DistrictAnalyzer analyzer;
	const auto result = analyzer.analyze(ts);
	REQUIRE(result.ok());
	REQUIRE(result.district() == "ok");
	REQUIRE_THROWS_AS(result.error(), std::logic_error);
}

TEST_CASE("Model selection breaks ties by simplicity", "[analysis][district][selection]") {
	using Errors = std::map<ModelKind, double>;

	REQUIRE(DistrictAnalyzer::selectBest(Errors{{ModelKind::SeasonalTrend, 5.0},
	                                            {ModelKind::LinearTrend, 5.0},
	                                            {ModelKind::EnsembleTree, 5.0}}) == ModelKind::LinearTrend);
	REQUIRE(DistrictAnalyzer::selectBest(Errors{{ModelKind::SeasonalTrend, 1.0},
	                                            {ModelKind::LinearTrend, 1.0 + 1e-12},
	                                            {ModelKind::EnsembleTree, 3.0}}) == ModelKind::LinearTrend);
	REQUIRE(DistrictAnalyzer::selectBest(Errors{{ModelKind::SeasonalTrend, 1.0},
	                                            {ModelKind::LinearTrend, 2.0},
	                                            {ModelKind::EnsembleTree, 1.0}}) == ModelKind::SeasonalTrend);
	REQUIRE(DistrictAnalyzer::selectBest(Errors{{ModelKind::SeasonalTrend, 4.0},
	                                            {ModelKind::LinearTrend, 2.0},
	                                            {ModelKind::EnsembleTree, 0.5}}) == ModelKind::EnsembleTree);
	REQUIRE_THROWS_AS(DistrictAnalyzer::selectBest(Errors{}), std::invalid_argument);
}

TEST_CASE("Error labels use two decimals", "[analysis][district]") {
	DistrictReport report;
	report.errors = {{ModelKind::LinearTrend, 12.3}, {ModelKind::SeasonalTrend, 0.0}};
	REQUIRE(report.errorLabel(ModelKind::LinearTrend) == "12.30%");
	REQUIRE(report.errorLabel(ModelKind::SeasonalTrend) == "0.00%");
	REQUIRE_THROWS_AS(report.errorLabel(ModelKind::EnsembleTree), std::out_of_range);
}

TEST_CASE("A failed refit excludes the district as a model failure", "[analysis][district][failure]") {
	auto ts = tests::helpers::makeMonthlySeries("fragile", tests::helpers::linearValues(48));

	const DistrictAnalyzer analyzer(AnalysisConfig(), tests::helpers::makeBrokenFactory());
	REQUIRE_THROWS_AS(analyzer.analyzeOrThrow(ts), estateforecast::core::ModelFitError);

	const auto result = analyzer.analyze(ts);
	REQUIRE_FALSE(result.ok());
	REQUIRE(result.error().reason() == FailureReason::ModelFit);
	REQUIRE(result.error().district() == "fragile");
}

TEST_CASE("Penalised windows still feed model selection", "[analysis][district][failure]") {
	auto ts = tests::helpers::makeMonthlySeries("north", tests::helpers::linearValues(72, 100.0, 1.0));

	// The linear model fails the windows training on 36 and 48 points but refits on the full history.
	const DistrictAnalyzer analyzer(AnalysisConfig(),
	                                tests::helpers::makeFailingFactory({ModelKind::LinearTrend}, 50));
	const auto outcome = analyzer.analyzeOrThrow(ts);

	REQUIRE(outcome.report.errorOf(ModelKind::LinearTrend) ==
	        Catch::Approx(2.0 * estateforecast::validation::Backtester::kPenaltyError / 3.0).margin(1e-6));
	REQUIRE(outcome.report.best_model == ModelKind::SeasonalTrend);
	REQUIRE(outcome.bundle.projections.count(ModelKind::LinearTrend) == 1);
}

TEST_CASE("Outcomes can be moved out of successful results only", "[analysis][district]") {
	const DistrictAnalyzer analyzer;

	auto ok = analyzer.analyze(tests::helpers::makeMonthlySeries("ok", tests::helpers::linearValues(24)));
	const auto outcome = std::move(ok).takeOutcome();
	REQUIRE(outcome.report.district == "ok");
	REQUIRE(outcome.bundle.history.size() == 24);

	auto failed = analyzer.analyze(tests::helpers::makeMonthlySeries("tiny", tests::helpers::linearValues(5)));
	REQUIRE_THROWS_AS(std::move(failed).takeOutcome(), DistrictAnalysisError);
}
