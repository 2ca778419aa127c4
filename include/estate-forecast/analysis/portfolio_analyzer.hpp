#pragma once

#include "estate-forecast/analysis/analysis_config.hpp"
#include "estate-forecast/analysis/portfolio_report.hpp"
#include "estate-forecast/core/panel.hpp"
#include "estate-forecast/core/time_series.hpp"
#include "estate-forecast/models/model_factory.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace estateforecast::analysis {

/**
 * @class PortfolioAnalyzer
 * @brief Runs the district analysis over a whole panel.
 *
 * With more than one thread configured, districts are handed out to workers
 * one at a time. Results are merged by input position, so the report does
 * not depend on scheduling. The model factory is shared by all workers and
 * must be safe to call concurrently.
 */
class PortfolioAnalyzer {
public:
	/// Called once per finished district with (completed, total, district).
	using ProgressCallback = std::function<void(std::size_t, std::size_t, const std::string &)>;

	/// @throws std::invalid_argument If @p factory is empty.
	explicit PortfolioAnalyzer(AnalysisConfig config = AnalysisConfig(),
	                           models::ForecasterFactory factory = models::createForecaster);

	const AnalysisConfig &config() const {
		return config_;
	}

	/**
	 * @brief Analyses every series.
	 *
	 * Calls to @p progress are serialised. An exception thrown by the callback
	 * stops the run and is rethrown once all workers have finished.
	 * @throws std::invalid_argument If two series share a district id.
	 */
	PortfolioReport run(const std::vector<core::TimeSeries> &series, const ProgressCallback &progress = {}) const;

	PortfolioReport run(const core::DistrictPanel &panel, const ProgressCallback &progress = {}) const {
		return run(panel.series(), progress);
	}

private:
	AnalysisConfig config_;
	models::ForecasterFactory factory_;
};

} // namespace estateforecast::analysis
