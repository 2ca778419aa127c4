#include "estate-forecast/analysis/portfolio_analyzer.hpp"
#include "estate-forecast/core/calendar.hpp"
#include "estate-forecast/core/panel.hpp"
#include "estate-forecast/models/model_kind.hpp"
#include "estate-forecast/utils/logging.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace estateforecast;

namespace {

// Eight years of synthetic monthly index values for a handful of districts.
std::vector<core::PriceRecord> syntheticRecords() {
	struct Profile {
		std::string district;
		double base;
		double growth;
		double seasonal;
		std::size_t months;
	};
	const std::vector<Profile> profiles{
	    {"Harbourside", 210.0, 0.9, 6.0, 96},
	    {"Old Town", 340.0, 0.2, 2.0, 96},
	    {"University Quarter", 150.0, 1.4, 9.0, 54},
	    {"Riverside", 275.0, -0.3, 4.0, 72},
	    {"Docklands", 120.0, 2.0, 1.0, 9},
	};

	constexpr double kPi = 3.14159265358979323846;
	std::vector<core::PriceRecord> records;
	for (const auto &profile : profiles) {
		int year = 2024 - static_cast<int>((profile.months + 11) / 12);
		unsigned month = 1;
		for (std::size_t i = 0; i < profile.months; ++i) {
			const double season = profile.seasonal * std::sin(2.0 * kPi * static_cast<double>(month - 1) / 12.0);
			const double wobble = 1.5 * std::sin(0.7 * static_cast<double>(i));
			records.push_back({core::calendar::fromCivil(year, month, 1), profile.district,
			                   profile.base + profile.growth * static_cast<double>(i) + season + wobble});
			if (++month > 12) {
				month = 1;
				++year;
			}
		}
	}
	return records;
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printReport(const analysis::PortfolioReport &report) {
	std::cout << "  " << std::setw(20) << std::left << "District" << std::setw(14) << "Best model" << std::right
	          << std::setw(10) << "Current" << std::setw(11) << "Expected";
	for (const auto kind : models::kAllModelKinds) {
		std::cout << std::setw(16) << models::modelKindName(kind);
	}
	std::cout << "\n";

	for (const auto &row : report.ranked(analysis::RankingKey::byExpectedReturn())) {
		std::cout << "  " << std::setw(20) << std::left << row.district << std::setw(14)
		          << models::modelKindName(row.best_model) << std::right << std::fixed << std::setprecision(2)
		          << std::setw(10) << row.current_price << std::setw(10) << row.expectedReturn() << "%";
		for (const auto kind : models::kAllModelKinds) {
			std::cout << std::setw(16) << row.errorLabel(kind);
		}
		std::cout << "\n";
	}
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::warn);

	const auto panel = core::DistrictPanel::fromRecords(syntheticRecords());
	const auto config = analysis::AnalysisConfig::Builder().withHorizon(12).withThreads(2).build();
	const analysis::PortfolioAnalyzer analyzer(config);

	printHeader("Analysing " + std::to_string(panel.size()) + " districts");
	const auto report =
	    analyzer.run(panel, [](std::size_t completed, std::size_t total, const std::string &district) {
		    std::cout << "  [" << completed << "/" << total << "] " << district << "\n";
	    });

	printHeader("Ranked by expected return (backtest MAPE per model)");
	printReport(report);

	if (!report.excluded().empty()) {
		printHeader("Excluded districts");
		for (const auto &error : report.excluded()) {
			std::cout << "  " << error.district() << " (" << analysis::failureReasonName(error.reason())
			          << "): " << error.what() << "\n";
		}
	}

	const auto &bundle = report.bundle("Harbourside");
	const auto &seasonal = bundle.projections.at(models::ModelKind::SeasonalTrend);
	printHeader("Harbourside seasonal projection");
	for (std::size_t h = 0; h < seasonal.horizon(); ++h) {
		std::cout << "  " << core::calendar::formatDate(seasonal.dates[h]) << "  " << std::fixed
		          << std::setprecision(2) << seasonal.point[h] << "  [" << seasonal.lowerSeries()[h] << ", "
		          << seasonal.upperSeries()[h] << "]\n";
	}

	return 0;
}
