#pragma once

#include "estate-forecast/core/projection.hpp"
#include "estate-forecast/core/time_series.hpp"
#include "estate-forecast/models/model_factory.hpp"
#include "estate-forecast/models/model_kind.hpp"

#include <map>
#include <vector>

namespace estateforecast::forecasting {

/**
 * @brief Projections of every model family refitted on a full history.
 */
struct ForecastResult {
	using TimePoint = core::TimeSeries::TimePoint;

	/// Month starts following the last history date.
	std::vector<TimePoint> future_dates;
	/// Forward projection per model, aligned with @ref future_dates.
	std::map<models::ModelKind, core::Projection> projections;
	/// Each refitted model evaluated at the history dates.
	std::map<models::ModelKind, core::Projection> in_sample;

	/// @throws std::out_of_range If @p kind has no projection.
	const core::Projection &projection(models::ModelKind kind) const {
		return projections.at(kind);
	}
};

/**
 * @class ForecastEngine
 * @brief Refits all models on the whole history and projects them forward.
 */
class ForecastEngine {
public:
	/// @throws std::invalid_argument If @p horizon is not positive or @p factory is empty.
	explicit ForecastEngine(int horizon, models::ForecasterFactory factory = models::createForecaster);

	int horizon() const {
		return horizon_;
	}

	/**
	 * @brief Refits every model on @p series and projects it @ref horizon months ahead.
	 * @throws core::ModelFitError If any model fails to fit or predict.
	 */
	ForecastResult run(const core::TimeSeries &series) const;

private:
	int horizon_;
	models::ForecasterFactory factory_;
};

} // namespace estateforecast::forecasting
