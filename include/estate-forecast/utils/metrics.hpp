#pragma once

#include <optional>
#include <vector>

namespace estateforecast::utils {

class Metrics final {
public:
	/**
	 * @brief Mean absolute percentage error, in percent.
	 *
	 * `mean(|actual - predicted| / |actual|) * 100` over the points whose actual
	 * value is non-zero. Empty when every actual value is zero, or when a
	 * prediction is not finite.
	 */
	static std::optional<double> mape(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace estateforecast::utils
