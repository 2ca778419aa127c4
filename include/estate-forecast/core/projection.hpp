#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <vector>

namespace estateforecast::core {

/**
 * @struct Projection
 * @brief Dated point predictions of one model.
 *
 * Holds the predicted price for every requested date and, for models that
 * produce one, the lower and upper bounds of the prediction interval.
 */
struct Projection {
	using TimePoint = std::chrono::system_clock::time_point;
	using Series = std::vector<double>;

	/// Dates the predictions refer to, in increasing order.
	std::vector<TimePoint> dates;

	/// Point predictions aligned with @ref dates.
	Series point;

	/// Optional lower bounds of the prediction interval.
	std::optional<Series> lower;

	/// Optional upper bounds of the prediction interval.
	std::optional<Series> upper;

	bool empty() const {
		return point.empty();
	}

	std::size_t horizon() const {
		return point.size();
	}

	bool hasInterval() const {
		return lower.has_value() && upper.has_value();
	}

	/// Last point prediction.
	double last() const {
		if (point.empty()) {
			throw std::out_of_range("Projection contains no values.");
		}
		return point.back();
	}

	const Series &lowerSeries() const {
		if (!lower.has_value()) {
			throw std::out_of_range("Lower interval not available for this projection.");
		}
		return *lower;
	}

	const Series &upperSeries() const {
		if (!upper.has_value()) {
			throw std::out_of_range("Upper interval not available for this projection.");
		}
		return *upper;
	}
};

} // namespace estateforecast::core
