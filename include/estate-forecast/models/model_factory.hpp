#pragma once

#include "estate-forecast/models/iforecaster.hpp"
#include "estate-forecast/models/model_kind.hpp"

#include <functional>
#include <memory>

namespace estateforecast::models {

/**
 * @brief Creates an unfitted model of the given kind with its production
 *        hyperparameters.
 *
 * Every call returns a fresh instance, so backtest windows never share state.
 */
std::unique_ptr<IForecaster> createForecaster(ModelKind kind);

/// Source of fresh models for backtests and refits; createForecaster by default.
using ForecasterFactory = std::function<std::unique_ptr<IForecaster>(ModelKind)>;

} // namespace estateforecast::models
