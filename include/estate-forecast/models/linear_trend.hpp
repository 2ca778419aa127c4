#pragma once

#include "estate-forecast/models/iforecaster.hpp"

namespace estateforecast::models {

/**
 * @class LinearTrend
 * @brief Ordinary least squares of price on the month ordinal of each date.
 */
class LinearTrend final : public IForecaster {
public:
	void fit(const core::TimeSeries &ts) override;
	core::Projection predict(const std::vector<TimePoint> &dates) override;

	std::string getName() const override {
		return "LinearTrend";
	}

	ModelKind kind() const override {
		return ModelKind::LinearTrend;
	}

	/// Price change per month.
	double slope() const {
		return slope_;
	}

	/// Fitted price at the mean training date.
	double intercept() const {
		return intercept_;
	}

private:
	double intercept_ = 0.0;
	double slope_ = 0.0;
	double origin_ = 0.0;
	bool is_fitted_ = false;
};

} // namespace estateforecast::models
