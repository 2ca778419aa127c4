#include "estate-forecast/models/ensemble_tree.hpp"
#include "estate-forecast/core/calendar.hpp"
#include "estate-forecast/core/errors.hpp"
#include "estate-forecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace estateforecast::models {

EnsembleTree::EnsembleTree(int n_trees, std::uint32_t seed, int max_depth, double min_samples_leaf)
    : n_trees_(n_trees), seed_(seed), max_depth_(max_depth), min_samples_leaf_(min_samples_leaf) {
	if (n_trees_ < 1) {
		throw std::invalid_argument("EnsembleTree requires at least one tree.");
	}
	if (max_depth_ < 0) {
		throw std::invalid_argument("Tree depth must be non-negative.");
	}
	if (!(min_samples_leaf_ > 0.0)) {
		throw std::invalid_argument("Minimum leaf weight must be positive.");
	}
}

void EnsembleTree::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	const auto &timestamps = ts.getTimestamps();
	const std::size_t n = values.size();
	if (n < 2) {
		throw core::InsufficientDataError("EnsembleTree requires at least two observations.");
	}

	is_fitted_ = false;
	std::vector<double> x(n);
	for (std::size_t i = 0; i < n; ++i) {
		x[i] = core::calendar::monthOrdinal(timestamps[i]);
	}

	// Reseeding on every fit keeps refits on identical data identical.
	std::mt19937 rng(seed_);
	std::uniform_int_distribution<std::size_t> draw(0, n - 1);

	trees_.clear();
	trees_.reserve(static_cast<std::size_t>(n_trees_));
	std::vector<double> counts(n);
	for (int t = 0; t < n_trees_; ++t) {
		std::fill(counts.begin(), counts.end(), 0.0);
		for (std::size_t s = 0; s < n; ++s) {
			counts[draw(rng)] += 1.0;
		}
		RegressionTree tree(max_depth_, min_samples_leaf_);
		tree.fit(x, values, counts);
		trees_.push_back(std::move(tree));
	}

	is_fitted_ = true;
	ESTATE_DEBUG("EnsembleTree fitted {} trees on {} points for '{}'.", trees_.size(), n, ts.district());
}

core::Projection EnsembleTree::predict(const std::vector<TimePoint> &dates) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}

	core::Projection projection;
	projection.dates = dates;
	projection.point.reserve(dates.size());
	for (const auto &date : dates) {
		const double x = core::calendar::monthOrdinal(date);
		double sum = 0.0;
		for (const auto &tree : trees_) {
			sum += tree.predict(x);
		}
		const double value = sum / static_cast<double>(trees_.size());
		if (!std::isfinite(value)) {
			throw core::ModelFitError("EnsembleTree produced a non-finite prediction.");
		}
		projection.point.push_back(value);
	}
	return projection;
}

// --- Builder Implementation ---

EnsembleTreeBuilder &EnsembleTreeBuilder::withTrees(int n_trees) {
	n_trees_ = n_trees;
	return *this;
}

EnsembleTreeBuilder &EnsembleTreeBuilder::withSeed(std::uint32_t seed) {
	seed_ = seed;
	return *this;
}

EnsembleTreeBuilder &EnsembleTreeBuilder::withMaxDepth(int max_depth) {
	max_depth_ = max_depth;
	return *this;
}

EnsembleTreeBuilder &EnsembleTreeBuilder::withMinSamplesLeaf(double min_samples_leaf) {
	min_samples_leaf_ = min_samples_leaf;
	return *this;
}

std::unique_ptr<EnsembleTree> EnsembleTreeBuilder::build() {
	return std::unique_ptr<EnsembleTree>(new EnsembleTree(n_trees_, seed_, max_depth_, min_samples_leaf_));
}

} // namespace estateforecast::models
