#include "estate-forecast/forecasting/forecast_engine.hpp"
#include "estate-forecast/core/calendar.hpp"
#include "estate-forecast/core/errors.hpp"
#include "estate-forecast/utils/logging.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace estateforecast::forecasting {

ForecastEngine::ForecastEngine(int horizon, models::ForecasterFactory factory)
    : horizon_(horizon), factory_(std::move(factory)) {
	if (horizon_ < 1) {
		throw std::invalid_argument("Forecast horizon must be at least one month.");
	}
	if (!factory_) {
		throw std::invalid_argument("Model factory must be callable.");
	}
}

ForecastResult ForecastEngine::run(const core::TimeSeries &series) const {
	if (series.isEmpty()) {
		throw core::InsufficientDataError("Cannot forecast an empty history.");
	}

	ForecastResult result;
	result.future_dates = core::calendar::monthStartsAfter(series.lastTimestamp(), horizon_);

	for (const auto kind : models::kAllModelKinds) {
		auto model = factory_(kind);
		if (!model) {
			throw core::ModelFitError("No model available for " + models::modelKindName(kind) + ".");
		}
		model->fit(series);

		auto projection = model->predict(result.future_dates);
		if (projection.horizon() != result.future_dates.size()) {
			throw core::ModelFitError(model->getName() + " returned " + std::to_string(projection.horizon()) +
			                          " values for a horizon of " + std::to_string(horizon_) + ".");
		}
		result.projections.emplace(kind, std::move(projection));
		result.in_sample.emplace(kind, model->predict(series.getTimestamps()));
	}

	ESTATE_DEBUG("Projected '{}' {} months ahead from {}.", series.district(), horizon_,
	             core::calendar::formatDate(series.lastTimestamp()));
	return result;
}

} // namespace estateforecast::forecasting
