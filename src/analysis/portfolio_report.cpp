#include "estate-forecast/analysis/portfolio_report.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace estateforecast::analysis {

double RankingKey::valueOf(const DistrictReport &report) const {
	switch (metric) {
	case Metric::Return:
		return report.returnOf(model);
	case Metric::FutureIndex:
		return report.futureIndex(model);
	case Metric::ExpectedReturn:
		return report.expectedReturn();
	}
	throw std::invalid_argument("Unknown ranking metric.");
}

void PortfolioReport::add(DistrictOutcome outcome) {
	const auto &district = outcome.report.district;
	if (bundles_.count(district) > 0) {
		throw std::invalid_argument("District '" + district + "' is already part of the report.");
	}
	bundles_.emplace(district, std::move(outcome.bundle));
	rows_.push_back(std::move(outcome.report));
}

void PortfolioReport::exclude(DistrictAnalysisError error) {
	excluded_.push_back(std::move(error));
}

void PortfolioReport::add(DistrictResult result) {
	if (result.ok()) {
		add(std::move(result).takeOutcome());
	} else {
		exclude(result.error());
	}
}

std::vector<DistrictReport> PortfolioReport::ranked(const RankingKey &key) const {
	std::vector<DistrictReport> sorted = rows_;
	std::sort(sorted.begin(), sorted.end(), [&key](const DistrictReport &lhs, const DistrictReport &rhs) {
		const double left = key.valueOf(lhs);
		const double right = key.valueOf(rhs);
		if (left != right) {
			return left > right;
		}
		return lhs.district < rhs.district;
	});
	return sorted;
}

const DistrictReport *PortfolioReport::find(const std::string &district) const {
	const auto it = std::find_if(rows_.begin(), rows_.end(),
	                             [&district](const DistrictReport &row) { return row.district == district; });
	return it == rows_.end() ? nullptr : &*it;
}

const ForecastBundle &PortfolioReport::bundle(const std::string &district) const {
	const auto it = bundles_.find(district);
	if (it == bundles_.end()) {
		throw std::out_of_range("No forecast bundle for district '" + district + "'.");
	}
	return it->second;
}

} // namespace estateforecast::analysis
