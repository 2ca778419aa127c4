#include "estate-forecast/analysis/portfolio_analyzer.hpp"
#include "estate-forecast/utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <thread>
#include <utility>

namespace estateforecast::analysis {

PortfolioAnalyzer::PortfolioAnalyzer(AnalysisConfig config, models::ForecasterFactory factory)
    : config_(config), factory_(std::move(factory)) {
	if (!factory_) {
		throw std::invalid_argument("Model factory must be callable.");
	}
}

PortfolioReport PortfolioAnalyzer::run(const std::vector<core::TimeSeries> &series,
                                       const ProgressCallback &progress) const {
	std::set<std::string> seen;
	for (const auto &ts : series) {
		if (!seen.insert(ts.district()).second) {
			throw std::invalid_argument("District '" + ts.district() + "' appears more than once.");
		}
	}

	const std::size_t total = series.size();
	const DistrictAnalyzer analyzer(config_, factory_);
	std::vector<std::optional<DistrictResult>> results(total);

	// Create the shared logger before any worker can race to do so.
	utils::Logging::getLogger();
	ESTATE_INFO("Analysing {} districts with {} thread(s), horizon {} months.", total, config_.threads(),
	            config_.horizon());

	std::mutex progress_mutex;
	std::size_t completed = 0;
	std::exception_ptr callback_error;
	std::atomic<std::size_t> next{0};
	std::atomic<bool> stop{false};

	auto worker = [&]() {
		while (!stop.load()) {
			const std::size_t index = next.fetch_add(1);
			if (index >= total) {
				return;
			}
			results[index].emplace(analyzer.analyze(series[index]));

			std::lock_guard<std::mutex> guard(progress_mutex);
			++completed;
			if (progress && !callback_error) {
				try {
					progress(completed, total, series[index].district());
				} catch (...) {
					callback_error = std::current_exception();
					stop.store(true);
				}
			}
		}
	};

	const std::size_t thread_count =
	    std::min<std::size_t>(static_cast<std::size_t>(config_.threads()), std::max<std::size_t>(total, 1));
	if (thread_count <= 1) {
		worker();
	} else {
		std::vector<std::thread> workers;
		workers.reserve(thread_count);
		for (std::size_t t = 0; t < thread_count; ++t) {
			workers.emplace_back(worker);
		}
		for (auto &thread : workers) {
			thread.join();
		}
	}

	if (callback_error) {
		std::rethrow_exception(callback_error);
	}

	PortfolioReport report;
	for (auto &result : results) {
		report.add(std::move(*result));
	}
	ESTATE_INFO("Portfolio analysis finished: {} districts reported, {} excluded.", report.size(),
	            report.excluded().size());
	return report;
}

} // namespace estateforecast::analysis
