#include "estate-forecast/models/linear_trend.hpp"
#include "estate-forecast/core/calendar.hpp"
#include "estate-forecast/core/errors.hpp"
#include "estate-forecast/utils/logging.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <numeric>
#include <stdexcept>

namespace estateforecast::models {

void LinearTrend::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	const auto &timestamps = ts.getTimestamps();
	const Eigen::Index n = static_cast<Eigen::Index>(values.size());
	if (n < 2) {
		throw core::InsufficientDataError("LinearTrend requires at least two observations.");
	}

	Eigen::VectorXd x(n);
	for (Eigen::Index i = 0; i < n; ++i) {
		x[i] = core::calendar::monthOrdinal(timestamps[static_cast<std::size_t>(i)]);
	}
	origin_ = x.mean();

	Eigen::MatrixXd design(n, 2);
	design.col(0).setOnes();
	design.col(1) = x.array() - origin_;
	const Eigen::VectorXd y = Eigen::Map<const Eigen::VectorXd>(values.data(), n);

	const auto qr = design.colPivHouseholderQr();
	if (qr.rank() < 2) {
		throw core::ModelFitError("LinearTrend design matrix is rank deficient.");
	}
	const Eigen::VectorXd coeffs = qr.solve(y);
	if (!coeffs.allFinite()) {
		throw core::ModelFitError("LinearTrend produced non-finite coefficients.");
	}

	intercept_ = coeffs[0];
	slope_ = coeffs[1];
	is_fitted_ = true;
	ESTATE_DEBUG("LinearTrend fitted on {} points for '{}': slope = {:.6f} per month.", n, ts.district(), slope_);
}

core::Projection LinearTrend::predict(const std::vector<TimePoint> &dates) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}

	core::Projection projection;
	projection.dates = dates;
	projection.point.reserve(dates.size());
	for (const auto &date : dates) {
		const double value = intercept_ + slope_ * (core::calendar::monthOrdinal(date) - origin_);
		if (!std::isfinite(value)) {
			throw core::ModelFitError("LinearTrend produced a non-finite prediction.");
		}
		projection.point.push_back(value);
	}
	return projection;
}

} // namespace estateforecast::models
