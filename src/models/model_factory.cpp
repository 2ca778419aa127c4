#include "estate-forecast/models/model_factory.hpp"
#include "estate-forecast/models/ensemble_tree.hpp"
#include "estate-forecast/models/linear_trend.hpp"
#include "estate-forecast/models/seasonal_trend.hpp"

#include <stdexcept>

namespace estateforecast::models {

std::unique_ptr<IForecaster> createForecaster(ModelKind kind) {
	switch (kind) {
	case ModelKind::SeasonalTrend:
		return SeasonalTrendBuilder().withFourierOrder(3).withPriorScale(10.0).withIntervalWidth(0.8).build();
	case ModelKind::LinearTrend:
		return std::make_unique<LinearTrend>();
	case ModelKind::EnsembleTree:
		return EnsembleTreeBuilder().withTrees(100).withSeed(42).build();
	}
	throw std::invalid_argument("Unknown model kind.");
}

} // namespace estateforecast::models
