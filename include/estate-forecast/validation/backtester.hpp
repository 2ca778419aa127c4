#pragma once

#include "estate-forecast/core/time_series.hpp"
#include "estate-forecast/models/model_factory.hpp"
#include "estate-forecast/models/model_kind.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace estateforecast::validation {

/**
 * @brief Index ranges of one rolling backtest window.
 *
 * Training covers `[0, train_end)`, testing `[test_start, test_end)`. The
 * depth counts windows back from the end of the series: depth 1 tests on the
 * last twelve points.
 */
struct BacktestWindow {
	int depth = 0;
	std::size_t train_end = 0;
	std::size_t test_start = 0;
	std::size_t test_end = 0;

	std::size_t trainSize() const {
		return train_end;
	}

	std::size_t testSize() const {
		return test_end - test_start;
	}
};

/**
 * @brief Historical accuracy of one model over all windows.
 */
struct ErrorScore {
	models::ModelKind kind = models::ModelKind::LinearTrend;
	/// Mean MAPE over evaluated windows, in percent.
	double error = 0.0;
	/// One entry per evaluated window, oldest window first.
	std::vector<double> window_errors;
	/// True when no window could be evaluated and @ref error is the sentinel.
	bool is_sentinel = false;

	std::size_t evaluatedWindows() const {
		return window_errors.size();
	}
};

struct BacktestResult {
	std::vector<BacktestWindow> windows;
	std::map<models::ModelKind, ErrorScore> scores;

	/// @throws std::out_of_range If @p kind was not scored.
	const ErrorScore &score(models::ModelKind kind) const {
		return scores.at(kind);
	}

	/// Mean error per model kind.
	std::map<models::ModelKind, double> errors() const;
};

/**
 * @class Backtester
 * @brief Scores every model family on rolling twelve-month windows.
 *
 * Histories longer than five years get three windows covering the last 36
 * points, histories longer than three years a single window over the last
 * 12 points, and shorter histories none. Each window refits fresh model
 * instances on everything that precedes the test range. A model that fails
 * on a window is charged the penalty error for it; a model with no evaluated
 * window at all reports the sentinel error.
 */
class Backtester {
public:
	static constexpr std::size_t kWindowLength = 12;
	static constexpr std::size_t kMinTrainLength = 2;
	static constexpr double kSentinelError = 99.9;
	static constexpr double kPenaltyError = 100.0;

	/// @throws std::invalid_argument If @p factory is empty.
	explicit Backtester(models::ForecasterFactory factory = models::createForecaster);

	/// Number of windows evaluated for a history of @p n points.
	static int windowCount(std::size_t n);

	/// Windows for a history of @p n points, deepest (oldest) first.
	static std::vector<BacktestWindow> windows(std::size_t n);

	BacktestResult run(const core::TimeSeries &series) const;

	std::map<models::ModelKind, double> errors(const core::TimeSeries &series) const {
		return run(series).errors();
	}

private:
	double evaluateWindow(const core::TimeSeries &series, const BacktestWindow &window,
	                      models::ModelKind kind) const;

	models::ForecasterFactory factory_;
};

} // namespace estateforecast::validation
