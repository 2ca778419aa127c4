#pragma once

#include <chrono>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace estateforecast::core {

/**
 * @class TimeSeries
 * @brief One district's price index history.
 *
 * Timestamps and prices are stored in separate vectors for cache-efficient
 * numerical processing. The constructor enforces the invariants every model
 * relies on: sizes match, timestamps are strictly increasing and every price
 * is finite and positive. Instances are immutable once built.
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param district Identifier of the sub-market the history belongs to.
	 * @param timestamps A vector of time points.
	 * @param values A vector of corresponding prices.
	 * @throws std::invalid_argument If sizes differ, timestamps are not strictly
	 *         increasing, or a price is not finite and positive.
	 */
	TimeSeries(std::string district, std::vector<TimePoint> timestamps, std::vector<Value> values)
	    : district_(std::move(district)), timestamps_(std::move(timestamps)), values_(std::move(values)) {
		if (timestamps_.size() != values_.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		validateTimestampOrder();
		validateValues();
	}

	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values)
	    : TimeSeries(std::string{}, std::move(timestamps), std::move(values)) {
	}

	const std::string &district() const {
		return district_;
	}

	/**
	 * @brief Gets the timestamps.
	 * @return A const reference to the vector of timestamps.
	 */
	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	/**
	 * @brief Gets the prices.
	 * @return A const reference to the vector of values.
	 */
	const std::vector<Value> &getValues() const {
		return values_;
	}

	/**
	 * @brief Gets the number of data points in the series.
	 */
	std::size_t size() const {
		return timestamps_.size();
	}

	bool isEmpty() const {
		return size() == 0;
	}

	const TimePoint &lastTimestamp() const {
		if (isEmpty()) {
			throw std::logic_error("TimeSeries is empty.");
		}
		return timestamps_.back();
	}

	Value lastValue() const {
		if (isEmpty()) {
			throw std::logic_error("TimeSeries is empty.");
		}
		return values_.back();
	}

	/**
	 * @brief Copies the half-open index range [start, end) into a new series.
	 * @throws std::invalid_argument If start > end.
	 * @throws std::out_of_range If end exceeds the series length.
	 */
	TimeSeries slice(std::size_t start, std::size_t end) const {
		if (start > end) {
			throw std::invalid_argument("Slice start index must not exceed end index.");
		}
		if (end > size()) {
			throw std::out_of_range("Slice end index exceeds the length of the time series.");
		}

		std::vector<TimePoint> sliced_timestamps(timestamps_.begin() + static_cast<std::ptrdiff_t>(start),
		                                         timestamps_.begin() + static_cast<std::ptrdiff_t>(end));
		std::vector<Value> sliced_values(values_.begin() + static_cast<std::ptrdiff_t>(start),
		                                 values_.begin() + static_cast<std::ptrdiff_t>(end));
		return TimeSeries(district_, std::move(sliced_timestamps), std::move(sliced_values));
	}

private:
	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (!(timestamps_[i] > timestamps_[i - 1])) {
				throw std::invalid_argument("TimeSeries timestamps must be strictly increasing and unique.");
			}
		}
	}

	void validateValues() const {
		for (const auto value : values_) {
			if (!std::isfinite(value) || value <= 0.0) {
				throw std::invalid_argument("TimeSeries prices must be finite and strictly positive.");
			}
		}
	}

	std::string district_;
	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
};

} // namespace estateforecast::core
