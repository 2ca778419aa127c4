#pragma once

#include "estate-forecast/models/iforecaster.hpp"
#include "estate-forecast/models/regression_tree.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace estateforecast::models {

class EnsembleTreeBuilder; // Forward declaration

/**
 * @class EnsembleTree
 * @brief Random forest of regression trees on the month ordinal.
 *
 * Every tree is grown on a bootstrap resample of the training points drawn
 * from a generator seeded with a fixed value, so repeated fits on the same
 * input produce the same forest. Beyond the training range each tree returns
 * its outermost leaf, which makes the forecast flat.
 */
class EnsembleTree final : public IForecaster {
public:
	friend class EnsembleTreeBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Projection predict(const std::vector<TimePoint> &dates) override;

	std::string getName() const override {
		return "EnsembleTree";
	}

	ModelKind kind() const override {
		return ModelKind::EnsembleTree;
	}

	std::size_t treeCount() const {
		return trees_.size();
	}

private:
	EnsembleTree(int n_trees, std::uint32_t seed, int max_depth, double min_samples_leaf);

	int n_trees_;
	std::uint32_t seed_;
	int max_depth_;
	double min_samples_leaf_;
	std::vector<RegressionTree> trees_;
	bool is_fitted_ = false;
};

/**
 * @class EnsembleTreeBuilder
 * @brief A builder for fluently configuring and creating EnsembleTree models.
 */
class EnsembleTreeBuilder {
public:
	EnsembleTreeBuilder &withTrees(int n_trees);
	EnsembleTreeBuilder &withSeed(std::uint32_t seed);
	/// 0 grows every tree until its leaves are pure.
	EnsembleTreeBuilder &withMaxDepth(int max_depth);
	EnsembleTreeBuilder &withMinSamplesLeaf(double min_samples_leaf);
	std::unique_ptr<EnsembleTree> build();

private:
	int n_trees_ = 100;
	std::uint32_t seed_ = 42;
	int max_depth_ = 0;
	double min_samples_leaf_ = 1.0;
};

} // namespace estateforecast::models
