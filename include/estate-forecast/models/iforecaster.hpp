#pragma once

#include "estate-forecast/core/projection.hpp"
#include "estate-forecast/core/time_series.hpp"
#include "estate-forecast/models/model_kind.hpp"

#include <string>
#include <vector>

namespace estateforecast::models {

/**
 * @class IForecaster
 * @brief An interface for all forecasting models.
 *
 * Models are stateful: fit() learns from a training series, predict() then
 * evaluates the learned function at arbitrary calendar dates, which may lie
 * inside or beyond the training range.
 */
class IForecaster {
public:
	using TimePoint = core::TimeSeries::TimePoint;

	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 * @param ts The time series data to train the model on.
	 * @throws core::InsufficientDataError If @p ts has fewer than two points.
	 * @throws core::ModelFitError If the numerical fit diverges.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Predicts prices at the given dates.
	 * @param dates Target dates; the projection is aligned 1:1 with them.
	 * @throws std::runtime_error If called before fit().
	 * @throws core::ModelFitError If a prediction is not finite.
	 */
	virtual core::Projection predict(const std::vector<TimePoint> &dates) = 0;

	/**
	 * @brief Gets the name of the forecasting model.
	 */
	virtual std::string getName() const = 0;

	virtual ModelKind kind() const = 0;
};

} // namespace estateforecast::models
