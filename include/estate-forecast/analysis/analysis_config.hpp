#pragma once

#include <stdexcept>

namespace estateforecast::analysis {

/**
 * @brief Run-wide settings of a district analysis.
 *
 * Window layout, error constants and model hyperparameters are fixed; only
 * the projection horizon and the degree of parallelism are configurable.
 */
class AnalysisConfig {
public:
	static constexpr int kDefaultHorizon = 12;
	static constexpr int kMaxHorizon = 60;

	class Builder;

	AnalysisConfig() = default;

	/// Months projected past the last history date.
	int horizon() const {
		return horizon_;
	}

	/// Worker threads used by PortfolioAnalyzer.
	int threads() const {
		return threads_;
	}

private:
	AnalysisConfig(int horizon, int threads) : horizon_(horizon), threads_(threads) {
	}

	int horizon_ = kDefaultHorizon;
	int threads_ = 1;
};

class AnalysisConfig::Builder {
public:
	/// @throws std::invalid_argument Unless 1 <= @p horizon <= 60.
	Builder &withHorizon(int horizon) {
		if (horizon < 1 || horizon > kMaxHorizon) {
			throw std::invalid_argument("Horizon must be between 1 and 60 months.");
		}
		horizon_ = horizon;
		return *this;
	}

	/// @throws std::invalid_argument If @p threads is below one.
	Builder &withThreads(int threads) {
		if (threads < 1) {
			throw std::invalid_argument("At least one worker thread is required.");
		}
		threads_ = threads;
		return *this;
	}

	AnalysisConfig build() const {
		return AnalysisConfig(horizon_, threads_);
	}

private:
	int horizon_ = kDefaultHorizon;
	int threads_ = 1;
};

} // namespace estateforecast::analysis
