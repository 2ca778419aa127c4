#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace estateforecast::models {

/**
 * @brief The closed set of model families evaluated for every district.
 *
 * Adding a family means adding an enumerator here, a case in
 * modelKindName() and createForecaster(), and a slot in the precedence order.
 */
enum class ModelKind {
	SeasonalTrend,
	LinearTrend,
	EnsembleTree
};

inline constexpr std::size_t kModelKindCount = 3;

/// Report/column order: seasonal, linear, ensemble.
inline constexpr std::array<ModelKind, kModelKindCount> kAllModelKinds = {
    ModelKind::SeasonalTrend, ModelKind::LinearTrend, ModelKind::EnsembleTree};

/// Tie-break order for model selection, simplest model first.
inline constexpr std::array<ModelKind, kModelKindCount> kSelectionPrecedence = {
    ModelKind::LinearTrend, ModelKind::SeasonalTrend, ModelKind::EnsembleTree};

inline std::string modelKindName(ModelKind kind) {
	switch (kind) {
	case ModelKind::SeasonalTrend:
		return "SeasonalTrend";
	case ModelKind::LinearTrend:
		return "LinearTrend";
	case ModelKind::EnsembleTree:
		return "EnsembleTree";
	}
	return "Unknown";
}

} // namespace estateforecast::models
