#include "estate-forecast/models/seasonal_trend.hpp"
#include "estate-forecast/core/calendar.hpp"
#include "estate-forecast/core/errors.hpp"
#include "estate-forecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace estateforecast::models {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kMonthsPerYear = 12.0;
// Two full years of history before yearly terms are estimated.
constexpr double kMinSeasonalSpanMonths = 24.0;

double normalQuantile(double p) {
	if (p <= 0.0) {
		return -std::numeric_limits<double>::infinity();
	}
	if (p >= 1.0) {
		return std::numeric_limits<double>::infinity();
	}
	if (std::abs(p - 0.5) < 1e-10) {
		return 0.0;
	}

	static const double a[] = {-3.969683028665376e1, 2.209460984245205e2,  -2.759285104469687e2,
	                           1.38357751867269e2,   -3.066479806614716e1, 2.506628277459239};
	static const double b[] = {-5.447609879822406e1, 1.615858368580409e2, -1.556989798598866e2, 6.680131188771972e1,
	                           -1.328068155288572e1};
	static const double c[] = {-7.784894002430293e-3, -3.223964580411365e-1, -2.400758277161838,
	                           -2.549732539343734,    4.374664141464968,     2.938163982698783};
	static const double d[] = {7.784695709041462e-3, 3.224671290700398e-1, 2.445134137142996, 3.754408661907416};
	constexpr double p_low = 0.02425;
	constexpr double p_high = 1.0 - p_low;

	if (p < p_low) {
		const double q = std::sqrt(-2.0 * std::log(p));
		return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
		       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
	}
	if (p <= p_high) {
		const double q = p - 0.5;
		const double r = q * q;
		return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
		       (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
	}

	const double q = std::sqrt(-2.0 * std::log(1.0 - p));
	return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
	       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
}

} // namespace

SeasonalTrend::SeasonalTrend(int fourier_order, double prior_scale, double interval_width)
    : fourier_order_(fourier_order), prior_scale_(prior_scale), interval_width_(interval_width) {
	if (fourier_order_ < 0) {
		throw std::invalid_argument("Fourier order must be non-negative.");
	}
	if (!(prior_scale_ > 0.0) || !std::isfinite(prior_scale_)) {
		throw std::invalid_argument("Seasonality prior scale must be positive.");
	}
	if (!(interval_width_ > 0.0 && interval_width_ < 1.0)) {
		throw std::invalid_argument("Interval width must be between 0 and 1.");
	}
}

Eigen::RowVectorXd SeasonalTrend::designRow(const TimePoint &date) const {
	Eigen::RowVectorXd row(2 + 2 * active_order_);
	row[0] = 1.0;
	row[1] = (core::calendar::monthOrdinal(date) - origin_) / time_scale_;
	const double position = core::calendar::monthOfYear(date);
	for (int k = 1; k <= active_order_; ++k) {
		const double angle = 2.0 * kPi * static_cast<double>(k) * position / kMonthsPerYear;
		row[2 * k] = std::sin(angle);
		row[2 * k + 1] = std::cos(angle);
	}
	return row;
}

void SeasonalTrend::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	const auto &timestamps = ts.getTimestamps();
	const Eigen::Index n = static_cast<Eigen::Index>(values.size());
	if (n < 2) {
		throw core::InsufficientDataError("SeasonalTrend requires at least two observations.");
	}

	is_fitted_ = false;
	double ordinal_sum = 0.0;
	for (const auto &timestamp : timestamps) {
		ordinal_sum += core::calendar::monthOrdinal(timestamp);
	}
	origin_ = ordinal_sum / static_cast<double>(n);
	const double span =
	    core::calendar::monthOrdinal(timestamps.back()) - core::calendar::monthOrdinal(timestamps.front());
	time_scale_ = std::max(span, 1.0);

	active_order_ = span >= kMinSeasonalSpanMonths ? fourier_order_ : 0;
	while (active_order_ > 0 && n <= 2 + 2 * active_order_) {
		--active_order_;
	}

	value_scale_ = 0.0;
	for (const auto value : values) {
		value_scale_ = std::max(value_scale_, std::abs(value));
	}

	const Eigen::Index p = 2 + 2 * active_order_;
	Eigen::MatrixXd design(n, p);
	Eigen::VectorXd y(n);
	for (Eigen::Index i = 0; i < n; ++i) {
		design.row(i) = designRow(timestamps[static_cast<std::size_t>(i)]);
		y[i] = values[static_cast<std::size_t>(i)] / value_scale_;
	}

	Eigen::MatrixXd normal = design.transpose() * design;
	const double penalty = 1.0 / (prior_scale_ * prior_scale_);
	for (Eigen::Index j = 2; j < p; ++j) {
		normal(j, j) += penalty;
	}
	const Eigen::LDLT<Eigen::MatrixXd> ldlt(normal);
	if (ldlt.info() != Eigen::Success) {
		throw core::ModelFitError("SeasonalTrend normal equations could not be factorised.");
	}
	coeffs_ = ldlt.solve(design.transpose() * y);
	if (!coeffs_.allFinite()) {
		throw core::ModelFitError("SeasonalTrend produced non-finite coefficients.");
	}

	const Eigen::VectorXd residuals = (y - design * coeffs_) * value_scale_;
	const Eigen::Index dof = n - p;
	residual_std_ = dof > 0 ? std::sqrt(residuals.squaredNorm() / static_cast<double>(dof)) : 0.0;
	if (!std::isfinite(residual_std_)) {
		throw core::ModelFitError("SeasonalTrend residual variance is not finite.");
	}

	last_train_date_ = ts.lastTimestamp();
	is_fitted_ = true;
	ESTATE_DEBUG("SeasonalTrend fitted on {} points for '{}' with {} Fourier pairs, residual std = {:.6f}.", n,
	             ts.district(), active_order_, residual_std_);
}

core::Projection SeasonalTrend::predict(const std::vector<TimePoint> &dates) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}

	const double z_score = normalQuantile(0.5 + interval_width_ / 2.0);

	core::Projection projection;
	projection.dates = dates;
	projection.point.reserve(dates.size());
	auto &lower = projection.lower.emplace();
	auto &upper = projection.upper.emplace();
	lower.reserve(dates.size());
	upper.reserve(dates.size());

	for (const auto &date : dates) {
		const double value = designRow(date).dot(coeffs_) * value_scale_;
		if (!std::isfinite(value)) {
			throw core::ModelFitError("SeasonalTrend produced a non-finite prediction.");
		}
		const int steps = std::max(1, core::calendar::monthsBetween(last_train_date_, date));
		const double half_width = z_score * residual_std_ * std::sqrt(static_cast<double>(steps));
		projection.point.push_back(value);
		lower.push_back(value - half_width);
		upper.push_back(value + half_width);
	}
	return projection;
}

// --- Builder Implementation ---

SeasonalTrendBuilder &SeasonalTrendBuilder::withFourierOrder(int order) {
	fourier_order_ = order;
	return *this;
}

SeasonalTrendBuilder &SeasonalTrendBuilder::withPriorScale(double scale) {
	prior_scale_ = scale;
	return *this;
}

SeasonalTrendBuilder &SeasonalTrendBuilder::withIntervalWidth(double width) {
	interval_width_ = width;
	return *this;
}

std::unique_ptr<SeasonalTrend> SeasonalTrendBuilder::build() {
	return std::unique_ptr<SeasonalTrend>(new SeasonalTrend(fourier_order_, prior_scale_, interval_width_));
}

} // namespace estateforecast::models
