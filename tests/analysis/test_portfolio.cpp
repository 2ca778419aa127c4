#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/forecaster_fixtures.hpp"
#include "common/series_helpers.hpp"
#include "estate-forecast/analysis/portfolio_analyzer.hpp"
#include "estate-forecast/analysis/portfolio_report.hpp"
#include "estate-forecast/core/panel.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using estateforecast::analysis::AnalysisConfig;
using estateforecast::analysis::DistrictReport;
using estateforecast::analysis::FailureReason;
using estateforecast::analysis::PortfolioAnalyzer;
using estateforecast::analysis::PortfolioReport;
using estateforecast::analysis::RankingKey;
using estateforecast::core::DistrictPanel;
using estateforecast::core::TimeSeries;
using estateforecast::models::ModelKind;

namespace {

std::vector<TimeSeries> makePortfolio() {
	return {
	    tests::helpers::makeMonthlySeries("riverside", tests::helpers::linearValues(48, 100.0, 1.0)),
	    tests::helpers::makeMonthlySeries("newbuild", tests::helpers::linearValues(10, 300.0, 2.0)),
	    tests::helpers::makeMonthlySeries("harbour", tests::helpers::seasonalValues(72, 200.0, 2.0)),
	    tests::helpers::makeMonthlySeries("oldtown", tests::helpers::linearValues(40, 500.0, -1.0)),
	};
}

std::vector<std::string> districtsOf(const std::vector<DistrictReport> &rows) {
	std::vector<std::string> names;
	for (const auto &row : rows) {
		names.push_back(row.district);
	}
	return names;
}

} // namespace

TEST_CASE("Portfolio keeps input order and lists exclusions", "[analysis][portfolio]") {
	const PortfolioAnalyzer analyzer;
	const auto report = analyzer.run(makePortfolio());

	REQUIRE(report.size() == 3);
	REQUIRE(districtsOf(report.rows()) == std::vector<std::string>{"riverside", "harbour", "oldtown"});
	REQUIRE(report.bundles().size() == 3);

	REQUIRE(report.excluded().size() == 1);
	REQUIRE(report.excluded().front().district() == "newbuild");
	REQUIRE(report.excluded().front().reason() == FailureReason::InsufficientHistory);

	REQUIRE(report.find("newbuild") == nullptr);
	REQUIRE_THROWS_AS(report.bundle("newbuild"), std::out_of_range);

	const auto *riverside = report.find("riverside");
	REQUIRE(riverside != nullptr);
	REQUIRE(riverside->best_model == ModelKind::LinearTrend);
	REQUIRE(report.bundle("riverside").history.size() == 48);
}

TEST_CASE("Portfolio ranking orders rows by the chosen key", "[analysis][portfolio][ranking]") {
	const PortfolioAnalyzer analyzer;
	const auto report = analyzer.run(makePortfolio());

	const auto by_expected = report.ranked(RankingKey::byExpectedReturn());
	REQUIRE(by_expected.size() == 3);
	for (std::size_t i = 1; i < by_expected.size(); ++i) {
		REQUIRE(by_expected[i - 1].expectedReturn() >= by_expected[i].expectedReturn());
	}
	// The declining district has the only negative outlook.
	REQUIRE(by_expected.back().district == "oldtown");

	const auto by_index = report.ranked(RankingKey::byFutureIndex(ModelKind::LinearTrend));
	REQUIRE(by_index.front().district == "oldtown");
	for (std::size_t i = 1; i < by_index.size(); ++i) {
		REQUIRE(by_index[i - 1].futureIndex(ModelKind::LinearTrend) >=
		        by_index[i].futureIndex(ModelKind::LinearTrend));
	}

	// Ranking never reorders the report itself.
	REQUIRE(districtsOf(report.rows()) == std::vector<std::string>{"riverside", "harbour", "oldtown"});
}

TEST_CASE("Portfolio ranking breaks ties by district id", "[analysis][portfolio][ranking]") {
	PortfolioReport report;
	for (const auto *name : {"zeta", "alpha", "mid"}) {
		DistrictReport row;
		row.district = name;
		row.current_price = 100.0;
		row.returns = {{ModelKind::LinearTrend, 5.0}};
		row.errors = {{ModelKind::LinearTrend, 1.0}};
		report.add({row, {tests::helpers::makeMonthlySeries(name, {1.0, 2.0}), {}, {}, {}, {}, {}}});
	}

	const auto ranked = report.ranked(RankingKey::byReturn(ModelKind::LinearTrend));
	REQUIRE(districtsOf(ranked) == std::vector<std::string>{"alpha", "mid", "zeta"});
	REQUIRE(districtsOf(report.rows()) == std::vector<std::string>{"zeta", "alpha", "mid"});
}

TEST_CASE("Parallel runs match sequential runs", "[analysis][portfolio][threads]") {
	const auto portfolio = makePortfolio();
	const auto sequential = PortfolioAnalyzer().run(portfolio);
	const auto parallel = PortfolioAnalyzer(AnalysisConfig::Builder().withThreads(4).build()).run(portfolio);

	REQUIRE(districtsOf(parallel.rows()) == districtsOf(sequential.rows()));
	for (std::size_t i = 0; i < sequential.size(); ++i) {
		REQUIRE(parallel.rows()[i].returns == sequential.rows()[i].returns);
		REQUIRE(parallel.rows()[i].errors == sequential.rows()[i].errors);
		REQUIRE(parallel.rows()[i].best_model == sequential.rows()[i].best_model);
	}
	REQUIRE(parallel.excluded().size() == sequential.excluded().size());
}

TEST_CASE("Portfolio reports progress once per district", "[analysis][portfolio][progress]") {
	const auto panel = DistrictPanel(makePortfolio());
	std::vector<std::size_t> completed;
	std::vector<std::string> districts;

	const PortfolioAnalyzer analyzer;
	analyzer.run(panel, [&](std::size_t done, std::size_t total, const std::string &district) {
		REQUIRE(total == 4);
		completed.push_back(done);
		districts.push_back(district);
	});

	REQUIRE(completed == std::vector<std::size_t>{1, 2, 3, 4});
	REQUIRE(districts == panel.districts());
}

TEST_CASE("Portfolio propagates progress callback failures", "[analysis][portfolio][progress]") {
	const PortfolioAnalyzer analyzer(AnalysisConfig::Builder().withThreads(2).build());
	const auto portfolio = makePortfolio();
	REQUIRE_THROWS_AS(analyzer.run(portfolio,
	                               [](std::size_t, std::size_t, const std::string &) {
		                               throw std::runtime_error("cancelled");
	                               }),
	                  std::runtime_error);
}

TEST_CASE("Portfolio rejects duplicate districts", "[analysis][portfolio][validation]") {
	auto portfolio = makePortfolio();
	portfolio.push_back(portfolio.front());

	const PortfolioAnalyzer analyzer;
	REQUIRE_THROWS_AS(analyzer.run(portfolio), std::invalid_argument);

	PortfolioReport report;
	const auto outcome = estateforecast::analysis::DistrictAnalyzer().analyzeOrThrow(portfolio.front());
	report.add(outcome);
	REQUIRE_THROWS_AS(report.add(outcome), std::invalid_argument);
}

TEST_CASE("Districts whose refit fails are listed as model failures", "[analysis][portfolio][failure]") {
	// The ensemble cannot be fitted on fewer than 50 points.
	const PortfolioAnalyzer analyzer(AnalysisConfig::Builder().withThreads(2).build(),
	                                 tests::helpers::makeFailingFactory({ModelKind::EnsembleTree}, 50));
	const auto report = analyzer.run(makePortfolio());

	REQUIRE(districtsOf(report.rows()) == std::vector<std::string>{"harbour"});
	REQUIRE(report.excluded().size() == 3);

	std::vector<std::string> model_failures;
	for (const auto &error : report.excluded()) {
		if (error.reason() == FailureReason::ModelFit) {
			model_failures.push_back(error.district());
		}
	}
	REQUIRE(model_failures == std::vector<std::string>{"riverside", "oldtown"});

	// Harbour survives the refit; its two shallower windows were penalised.
	const auto *harbour = report.find("harbour");
	REQUIRE(harbour != nullptr);
	REQUIRE(harbour->errorOf(ModelKind::EnsembleTree) >=
	        2.0 * estateforecast::validation::Backtester::kPenaltyError / 3.0);
}

TEST_CASE("Report accepts results directly", "[analysis][portfolio]") {
	const estateforecast::analysis::DistrictAnalyzer analyzer;
	PortfolioReport report;
	report.add(analyzer.analyze(tests::helpers::makeMonthlySeries("kept", tests::helpers::linearValues(24))));
	report.add(analyzer.analyze(tests::helpers::makeMonthlySeries("dropped", tests::helpers::linearValues(6))));

	REQUIRE(districtsOf(report.rows()) == std::vector<std::string>{"kept"});
	REQUIRE(report.bundle("kept").history.size() == 24);
	REQUIRE(report.excluded().size() == 1);
	REQUIRE(report.excluded().front().district() == "dropped");
}
