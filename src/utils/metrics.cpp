#include "estate-forecast/utils/metrics.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace estateforecast::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

} // namespace

std::optional<double> Metrics::mape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	size_t count = 0;
	for (size_t i = 0; i < actual.size(); ++i) {
		if (!std::isfinite(predicted[i])) {
			return std::nullopt;
		}
		const double denom = std::abs(actual[i]);
		if (denom > std::numeric_limits<double>::epsilon()) {
			sum += std::abs(actual[i] - predicted[i]) / denom;
			++count;
		}
	}
	if (count == 0)
		return std::nullopt;
	return (sum / static_cast<double>(count)) * 100.0;
}

} // namespace estateforecast::utils
