#include "estate-forecast/analysis/district_analyzer.hpp"
#include "estate-forecast/forecasting/forecast_engine.hpp"
#include "estate-forecast/utils/logging.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace estateforecast::analysis {

std::string DistrictReport::errorLabel(models::ModelKind kind) const {
	return fmt::format("{:.2f}%", errors.at(kind));
}

std::string failureReasonName(FailureReason reason) {
	switch (reason) {
	case FailureReason::InsufficientHistory:
		return "InsufficientHistory";
	case FailureReason::ModelFit:
		return "ModelFit";
	case FailureReason::InvalidInput:
		return "InvalidInput";
	case FailureReason::Unexpected:
		return "Unexpected";
	}
	return "Unknown";
}

const std::string &DistrictResult::district() const {
	if (ok()) {
		return std::get<DistrictOutcome>(state_).report.district;
	}
	return std::get<DistrictAnalysisError>(state_).district();
}

const DistrictOutcome &DistrictResult::outcome() const {
	if (const auto *error = std::get_if<DistrictAnalysisError>(&state_)) {
		throw *error;
	}
	return std::get<DistrictOutcome>(state_);
}

DistrictOutcome DistrictResult::takeOutcome() && {
	if (const auto *error = std::get_if<DistrictAnalysisError>(&state_)) {
		throw *error;
	}
	return std::get<DistrictOutcome>(std::move(state_));
}

const DistrictAnalysisError &DistrictResult::error() const {
	if (ok()) {
		throw std::logic_error("District analysis succeeded, there is no error.");
	}
	return std::get<DistrictAnalysisError>(state_);
}

DistrictAnalyzer::DistrictAnalyzer(AnalysisConfig config, models::ForecasterFactory factory)
    : config_(config), factory_(std::move(factory)) {
	if (!factory_) {
		throw std::invalid_argument("Model factory must be callable.");
	}
}

models::ModelKind DistrictAnalyzer::selectBest(const std::map<models::ModelKind, double> &errors) {
	if (errors.empty()) {
		throw std::invalid_argument("Cannot select a model without errors.");
	}

	double minimum = std::numeric_limits<double>::infinity();
	for (const auto &[kind, error] : errors) {
		minimum = std::min(minimum, error);
	}
	for (const auto kind : models::kSelectionPrecedence) {
		const auto it = errors.find(kind);
		if (it != errors.end() && it->second <= minimum + kTieTolerance) {
			return kind;
		}
	}
	// Only reachable when every error is NaN.
	throw std::invalid_argument("Model errors are not comparable.");
}

DistrictOutcome DistrictAnalyzer::analyzeOrThrow(const core::TimeSeries &series) const {
	if (series.size() < kMinHistory) {
		throw core::InsufficientHistoryError(series.district(), series.size(), kMinHistory);
	}

	const validation::Backtester backtester(factory_);
	auto backtest = backtester.run(series);
	auto errors = backtest.errors();

	const forecasting::ForecastEngine engine(config_.horizon(), factory_);
	auto forecast = engine.run(series);

	DistrictReport report;
	report.district = series.district();
	report.last_date = series.lastTimestamp();
	report.current_price = series.lastValue();
	report.horizon = config_.horizon();
	report.errors = errors;
	for (const auto &[kind, projection] : forecast.projections) {
		report.returns.emplace(kind, (projection.last() - report.current_price) / report.current_price * 100.0);
	}
	report.best_model = selectBest(errors);

	ESTATE_DEBUG("'{}': best model {} with error {:.4f}%, expected return {:.2f}%.", report.district,
	             models::modelKindName(report.best_model), errors.at(report.best_model), report.expectedReturn());

	ForecastBundle bundle{series,
	                      std::move(forecast.future_dates),
	                      std::move(forecast.projections),
	                      std::move(forecast.in_sample),
	                      std::move(errors),
	                      std::move(backtest.windows)};
	return DistrictOutcome{std::move(report), std::move(bundle)};
}

DistrictResult DistrictAnalyzer::analyze(const core::TimeSeries &series) const {
	const auto &district = series.district();
	try {
		return DistrictResult(analyzeOrThrow(series));
	} catch (const core::InsufficientHistoryError &ex) {
		ESTATE_WARN("Excluding district '{}': {}", district, ex.what());
		return DistrictResult(DistrictAnalysisError(district, FailureReason::InsufficientHistory, ex.what()));
	} catch (const core::ForecastError &ex) {
		ESTATE_WARN("Excluding district '{}' after a model failure: {}", district, ex.what());
		return DistrictResult(DistrictAnalysisError(district, FailureReason::ModelFit, ex.what()));
	} catch (const std::logic_error &ex) {
		ESTATE_WARN("Excluding district '{}' on invalid input: {}", district, ex.what());
		return DistrictResult(DistrictAnalysisError(district, FailureReason::InvalidInput, ex.what()));
	} catch (const std::exception &ex) {
		ESTATE_ERROR("Unexpected failure while analysing district '{}': {}", district, ex.what());
		return DistrictResult(DistrictAnalysisError(district, FailureReason::Unexpected, ex.what()));
	}
}

} // namespace estateforecast::analysis
