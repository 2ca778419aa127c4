#pragma once

#include "estate-forecast/core/time_series.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace estateforecast::core {

/**
 * @brief One long-format input row.
 */
struct PriceRecord {
	TimeSeries::TimePoint date;
	std::string district;
	double price = 0.0;
};

/**
 * @class DistrictPanel
 * @brief Per-district price histories built from long-format rows.
 *
 * Districts keep the order in which they first appear in the input; each
 * district's rows are sorted by date.
 */
class DistrictPanel {
public:
	DistrictPanel() = default;
	explicit DistrictPanel(std::vector<TimeSeries> series);

	/**
	 * @brief Groups rows by district.
	 * @throws std::invalid_argument On an empty district id, a duplicate date
	 *         within a district or a non-positive price.
	 */
	static DistrictPanel fromRecords(std::vector<PriceRecord> records);

	const std::vector<TimeSeries> &series() const {
		return series_;
	}

	std::size_t size() const {
		return series_.size();
	}

	bool empty() const {
		return series_.empty();
	}

	std::vector<std::string> districts() const;

	/// @throws std::out_of_range If the district is unknown.
	const TimeSeries &at(const std::string &district) const;

private:
	std::vector<TimeSeries> series_;
};

} // namespace estateforecast::core
