#pragma once

#include "estate-forecast/analysis/analysis_config.hpp"
#include "estate-forecast/core/errors.hpp"
#include "estate-forecast/core/projection.hpp"
#include "estate-forecast/core/time_series.hpp"
#include "estate-forecast/models/model_factory.hpp"
#include "estate-forecast/models/model_kind.hpp"
#include "estate-forecast/validation/backtester.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace estateforecast::analysis {

/**
 * @brief Decision record of one district.
 */
struct DistrictReport {
	using TimePoint = core::TimeSeries::TimePoint;

	std::string district;
	TimePoint last_date{};
	/// Last observed price.
	double current_price = 0.0;
	int horizon = 0;
	/// Percent change from the current price to each model's last projected value.
	std::map<models::ModelKind, double> returns;
	/// Backtest MAPE per model, in percent.
	std::map<models::ModelKind, double> errors;
	models::ModelKind best_model = models::ModelKind::LinearTrend;

	/// Return of the best model.
	double expectedReturn() const {
		return returns.at(best_model);
	}

	double returnOf(models::ModelKind kind) const {
		return returns.at(kind);
	}

	double errorOf(models::ModelKind kind) const {
		return errors.at(kind);
	}

	/// Projected index level `current_price * (1 + return / 100)`.
	double futureIndex(models::ModelKind kind) const {
		return current_price * (1.0 + returns.at(kind) / 100.0);
	}

	/// Error formatted for display, e.g. "12.34%".
	std::string errorLabel(models::ModelKind kind) const;
};

/**
 * @brief Full forecasting detail of one district, for charting.
 */
struct ForecastBundle {
	core::TimeSeries history;
	std::vector<core::TimeSeries::TimePoint> future_dates;
	std::map<models::ModelKind, core::Projection> projections;
	std::map<models::ModelKind, core::Projection> in_sample;
	std::map<models::ModelKind, double> errors;
	std::vector<validation::BacktestWindow> windows;
};

struct DistrictOutcome {
	DistrictReport report;
	ForecastBundle bundle;
};

enum class FailureReason {
	InsufficientHistory,
	ModelFit,
	InvalidInput,
	Unexpected
};

std::string failureReasonName(FailureReason reason);

/**
 * @brief Why a district was left out of the portfolio.
 */
class DistrictAnalysisError : public core::ForecastError {
public:
	DistrictAnalysisError(std::string district, FailureReason reason, const std::string &message)
	    : core::ForecastError(message), district_(std::move(district)), reason_(reason) {
	}

	const std::string &district() const {
		return district_;
	}

	FailureReason reason() const {
		return reason_;
	}

private:
	std::string district_;
	FailureReason reason_;
};

/**
 * @brief Either the outcome of a district analysis or the error that stopped it.
 */
class DistrictResult {
public:
	DistrictResult(DistrictOutcome outcome) : state_(std::move(outcome)) {
	}

	DistrictResult(DistrictAnalysisError error) : state_(std::move(error)) {
	}

	bool ok() const {
		return std::holds_alternative<DistrictOutcome>(state_);
	}

	const std::string &district() const;

	/// @throws DistrictAnalysisError If the analysis failed.
	const DistrictReport &report() const {
		return outcome().report;
	}

	/// @throws DistrictAnalysisError If the analysis failed.
	const ForecastBundle &bundle() const {
		return outcome().bundle;
	}

	/// @throws DistrictAnalysisError If the analysis failed.
	const DistrictOutcome &outcome() const;

	/// Moves the outcome out of a successful result.
	/// @throws DistrictAnalysisError If the analysis failed.
	DistrictOutcome takeOutcome() &&;

	/// @throws std::logic_error If the analysis succeeded.
	const DistrictAnalysisError &error() const;

private:
	std::variant<DistrictOutcome, DistrictAnalysisError> state_;
};

/**
 * @class DistrictAnalyzer
 * @brief Backtests, refits and selects a model for a single district.
 */
class DistrictAnalyzer {
public:
	/// Shortest history that is analysed at all.
	static constexpr std::size_t kMinHistory = 12;
	/// Errors this close to the minimum count as tied.
	static constexpr double kTieTolerance = 1e-9;

	/// @throws std::invalid_argument If @p factory is empty.
	explicit DistrictAnalyzer(AnalysisConfig config = AnalysisConfig(),
	                          models::ForecasterFactory factory = models::createForecaster);

	const AnalysisConfig &config() const {
		return config_;
	}

	/**
	 * @brief Analyses one district, capturing any failure in the result.
	 *
	 * Never throws; failures are logged as warnings.
	 */
	DistrictResult analyze(const core::TimeSeries &series) const;

	/**
	 * @brief Analyses one district.
	 * @throws core::InsufficientHistoryError If the history has fewer than 12 points.
	 * @throws core::ModelFitError If the full-history refit fails.
	 */
	DistrictOutcome analyzeOrThrow(const core::TimeSeries &series) const;

	/**
	 * @brief Model with the lowest error.
	 *
	 * Ties within kTieTolerance go to the first kind in kSelectionPrecedence.
	 * @throws std::invalid_argument If @p errors is empty.
	 */
	static models::ModelKind selectBest(const std::map<models::ModelKind, double> &errors);

private:
	AnalysisConfig config_;
	models::ForecasterFactory factory_;
};

} // namespace estateforecast::analysis
