#include "estate-forecast/validation/backtester.hpp"
#include "estate-forecast/core/errors.hpp"
#include "estate-forecast/models/model_factory.hpp"
#include "estate-forecast/utils/logging.hpp"
#include "estate-forecast/utils/metrics.hpp"

#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace estateforecast::validation {

std::map<models::ModelKind, double> BacktestResult::errors() const {
	std::map<models::ModelKind, double> result;
	for (const auto &[kind, score] : scores) {
		result.emplace(kind, score.error);
	}
	return result;
}

Backtester::Backtester(models::ForecasterFactory factory) : factory_(std::move(factory)) {
	if (!factory_) {
		throw std::invalid_argument("Model factory must be callable.");
	}
}

int Backtester::windowCount(std::size_t n) {
	if (n > 60) {
		return 3;
	}
	if (n > 36) {
		return 1;
	}
	return 0;
}

std::vector<BacktestWindow> Backtester::windows(std::size_t n) {
	std::vector<BacktestWindow> result;
	const int count = windowCount(n);
	result.reserve(static_cast<std::size_t>(count));
	for (int k = count; k >= 1; --k) {
		const std::size_t offset = kWindowLength * static_cast<std::size_t>(k - 1);
		BacktestWindow window;
		window.depth = k;
		window.test_end = n - offset;
		window.test_start = window.test_end - kWindowLength;
		window.train_end = window.test_start;
		result.push_back(window);
	}
	return result;
}

double Backtester::evaluateWindow(const core::TimeSeries &series, const BacktestWindow &window,
                                  models::ModelKind kind) const {
	if (window.test_end > series.size() || window.test_start > window.test_end ||
	    window.train_end > window.test_start) {
		throw core::InsufficientWindowError("Window " + std::to_string(window.depth) +
		                                    " does not fit a history of " + std::to_string(series.size()) +
		                                    " points.");
	}
	if (window.trainSize() < kMinTrainLength || window.testSize() == 0) {
		throw core::InsufficientWindowError("Window " + std::to_string(window.depth) +
		                                    " leaves too few points to train or test.");
	}

	const auto train = series.slice(0, window.train_end);
	const auto test = series.slice(window.test_start, window.test_end);

	auto model = factory_(kind);
	if (!model) {
		throw core::ModelFitError("No model available for " + models::modelKindName(kind) + ".");
	}
	model->fit(train);
	const auto projection = model->predict(test.getTimestamps());

	const auto mape = utils::Metrics::mape(test.getValues(), projection.point);
	if (!mape) {
		throw core::ModelFitError(model->getName() + " produced predictions MAPE cannot be computed on.");
	}
	return *mape;
}

BacktestResult Backtester::run(const core::TimeSeries &series) const {
	BacktestResult result;
	result.windows = windows(series.size());

	for (const auto kind : models::kAllModelKinds) {
		ErrorScore score;
		score.kind = kind;

		for (const auto &window : result.windows) {
			try {
				score.window_errors.push_back(evaluateWindow(series, window, kind));
			} catch (const core::InsufficientWindowError &ex) {
				ESTATE_WARN("Skipping window {} for {} on '{}': {}", window.depth, models::modelKindName(kind),
				            series.district(), ex.what());
			} catch (const std::exception &ex) {
				ESTATE_WARN("{} failed on window {} for '{}', charging {:.1f}%: {}", models::modelKindName(kind),
				            window.depth, series.district(), kPenaltyError, ex.what());
				score.window_errors.push_back(kPenaltyError);
			}
		}

		if (score.window_errors.empty()) {
			score.error = kSentinelError;
			score.is_sentinel = true;
		} else {
			score.error = std::accumulate(score.window_errors.begin(), score.window_errors.end(), 0.0) /
			              static_cast<double>(score.window_errors.size());
		}
		result.scores.emplace(kind, std::move(score));
	}

	ESTATE_DEBUG("Backtest of '{}' evaluated {} windows.", series.district(), result.windows.size());
	return result;
}

} // namespace estateforecast::validation
