#pragma once

#include "estate-forecast/analysis/district_analyzer.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace estateforecast::analysis {

/**
 * @brief Column a portfolio table can be ranked by.
 */
struct RankingKey {
	enum class Metric {
		Return,
		FutureIndex,
		ExpectedReturn
	};

	Metric metric = Metric::ExpectedReturn;
	/// Ignored for Metric::ExpectedReturn.
	models::ModelKind model = models::ModelKind::LinearTrend;

	static RankingKey byReturn(models::ModelKind kind) {
		return RankingKey{Metric::Return, kind};
	}

	static RankingKey byFutureIndex(models::ModelKind kind) {
		return RankingKey{Metric::FutureIndex, kind};
	}

	static RankingKey byExpectedReturn() {
		return RankingKey{Metric::ExpectedReturn, models::ModelKind::LinearTrend};
	}

	double valueOf(const DistrictReport &report) const;
};

/**
 * @class PortfolioReport
 * @brief Reports of every analysed district plus the districts left out.
 *
 * Rows keep the order the districts were submitted in; ranked() returns
 * re-ordered copies.
 */
class PortfolioReport {
public:
	/// @throws std::invalid_argument If the district is already present.
	void add(DistrictOutcome outcome);
	void exclude(DistrictAnalysisError error);
	void add(DistrictResult result);

	const std::vector<DistrictReport> &rows() const {
		return rows_;
	}

	const std::map<std::string, ForecastBundle> &bundles() const {
		return bundles_;
	}

	const std::vector<DistrictAnalysisError> &excluded() const {
		return excluded_;
	}

	std::size_t size() const {
		return rows_.size();
	}

	bool empty() const {
		return rows_.empty();
	}

	/// Rows sorted by @p key, highest first; equal values ordered by district id.
	std::vector<DistrictReport> ranked(const RankingKey &key) const;

	/// nullptr if the district has no row.
	const DistrictReport *find(const std::string &district) const;

	/// @throws std::out_of_range If the district has no bundle.
	const ForecastBundle &bundle(const std::string &district) const;

private:
	std::vector<DistrictReport> rows_;
	std::map<std::string, ForecastBundle> bundles_;
	std::vector<DistrictAnalysisError> excluded_;
};

} // namespace estateforecast::analysis
