#include "estate-forecast/core/panel.hpp"
#include "estate-forecast/core/calendar.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace estateforecast::core {

DistrictPanel::DistrictPanel(std::vector<TimeSeries> series) : series_(std::move(series)) {
	std::unordered_set<std::string> seen;
	for (const auto &entry : series_) {
		if (!seen.insert(entry.district()).second) {
			throw std::invalid_argument("District '" + entry.district() + "' appears more than once in the panel.");
		}
	}
}

DistrictPanel DistrictPanel::fromRecords(std::vector<PriceRecord> records) {
	std::vector<std::string> order;
	std::unordered_map<std::string, std::vector<PriceRecord>> grouped;

	for (auto &record : records) {
		if (record.district.empty()) {
			throw std::invalid_argument("Price record has an empty district id.");
		}
		auto it = grouped.find(record.district);
		if (it == grouped.end()) {
			order.push_back(record.district);
			it = grouped.emplace(record.district, std::vector<PriceRecord>{}).first;
		}
		it->second.push_back(std::move(record));
	}

	std::vector<TimeSeries> series;
	series.reserve(order.size());
	for (const auto &district : order) {
		auto &rows = grouped[district];
		std::stable_sort(rows.begin(), rows.end(),
		                 [](const PriceRecord &lhs, const PriceRecord &rhs) { return lhs.date < rhs.date; });

		std::vector<TimeSeries::TimePoint> timestamps;
		std::vector<double> values;
		timestamps.reserve(rows.size());
		values.reserve(rows.size());
		for (const auto &row : rows) {
			if (!timestamps.empty() && timestamps.back() == row.date) {
				throw std::invalid_argument("District '" + district + "' has more than one price for " +
				                            calendar::formatDate(row.date) + ".");
			}
			timestamps.push_back(row.date);
			values.push_back(row.price);
		}
		series.emplace_back(district, std::move(timestamps), std::move(values));
	}

	return DistrictPanel(std::move(series));
}

std::vector<std::string> DistrictPanel::districts() const {
	std::vector<std::string> names;
	names.reserve(series_.size());
	for (const auto &entry : series_) {
		names.push_back(entry.district());
	}
	return names;
}

const TimeSeries &DistrictPanel::at(const std::string &district) const {
	const auto it = std::find_if(series_.begin(), series_.end(),
	                             [&](const TimeSeries &entry) { return entry.district() == district; });
	if (it == series_.end()) {
		throw std::out_of_range("District '" + district + "' not found in panel.");
	}
	return *it;
}

} // namespace estateforecast::core
