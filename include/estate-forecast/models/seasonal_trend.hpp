#pragma once

#include "estate-forecast/models/iforecaster.hpp"

#include <Eigen/Dense>
#include <memory>

namespace estateforecast::models {

class SeasonalTrendBuilder; // Forward declaration

/**
 * @class SeasonalTrend
 * @brief Additive trend plus yearly seasonality fitted against calendar dates.
 *
 * The model regresses the scaled price on
 *
 *     1, t, sin(2*pi*k*m/12), cos(2*pi*k*m/12)   for k = 1..K
 *
 * where t is the centred month ordinal and m the position of the date inside
 * its year in months. The seasonal coefficients carry a ridge penalty of
 * 1 / prior_scale^2. Yearly terms are only used once the training span covers
 * two full years; shorter histories fall back to the trend alone.
 *
 * Predictions carry a prediction interval of the configured width whose
 * half-width grows with the square root of the number of months past the
 * last training date.
 */
class SeasonalTrend final : public IForecaster {
public:
	friend class SeasonalTrendBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Projection predict(const std::vector<TimePoint> &dates) override;

	std::string getName() const override {
		return "SeasonalTrend";
	}

	ModelKind kind() const override {
		return ModelKind::SeasonalTrend;
	}

	/// Number of Fourier pairs used by the last fit (0 when seasonality was disabled).
	int activeFourierOrder() const {
		return active_order_;
	}

	/// Residual standard deviation of the last fit, in price units.
	double residualStd() const {
		return residual_std_;
	}

private:
	SeasonalTrend(int fourier_order, double prior_scale, double interval_width);

	Eigen::RowVectorXd designRow(const TimePoint &date) const;

	int fourier_order_;
	double prior_scale_;
	double interval_width_;

	int active_order_ = 0;
	double origin_ = 0.0;
	double time_scale_ = 1.0;
	double value_scale_ = 1.0;
	double residual_std_ = 0.0;
	TimePoint last_train_date_{};
	Eigen::VectorXd coeffs_;
	bool is_fitted_ = false;
};

/**
 * @class SeasonalTrendBuilder
 * @brief A builder for fluently configuring and creating SeasonalTrend models.
 */
class SeasonalTrendBuilder {
public:
	/// Number of yearly Fourier pairs (>= 0).
	SeasonalTrendBuilder &withFourierOrder(int order);

	/// Prior scale of the seasonal coefficients (> 0); larger means less shrinkage.
	SeasonalTrendBuilder &withPriorScale(double scale);

	/// Coverage of the prediction interval, in (0, 1).
	SeasonalTrendBuilder &withIntervalWidth(double width);

	std::unique_ptr<SeasonalTrend> build();

private:
	int fourier_order_ = 3;
	double prior_scale_ = 10.0;
	double interval_width_ = 0.8;
};

} // namespace estateforecast::models
