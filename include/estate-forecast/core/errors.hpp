#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace estateforecast::core {

/**
 * @brief Base class of every failure raised by the forecasting pipeline.
 */
class ForecastError : public std::runtime_error {
public:
	explicit ForecastError(const std::string &message) : std::runtime_error(message) {
	}
};

/**
 * @brief A district has too little history to be analysed at all.
 */
class InsufficientHistoryError : public ForecastError {
public:
	InsufficientHistoryError(const std::string &district, std::size_t observed, std::size_t required)
	    : ForecastError("District '" + district + "' has " + std::to_string(observed) +
	                    " observations, at least " + std::to_string(required) + " are required."),
	      observed_(observed), required_(required) {
	}

	std::size_t observed() const {
		return observed_;
	}

	std::size_t required() const {
		return required_;
	}

private:
	std::size_t observed_;
	std::size_t required_;
};

/**
 * @brief A backtest window cannot be formed from the available history.
 */
class InsufficientWindowError : public ForecastError {
public:
	using ForecastError::ForecastError;
};

/**
 * @brief A model fit or prediction failed (divergence, degenerate input).
 */
class ModelFitError : public ForecastError {
public:
	using ForecastError::ForecastError;
};

/**
 * @brief The training series is too short for the model to be fitted.
 */
class InsufficientDataError : public ModelFitError {
public:
	using ModelFitError::ModelFitError;
};

} // namespace estateforecast::core
