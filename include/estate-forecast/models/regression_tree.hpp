#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace estateforecast::models {

/**
 * @class RegressionTree
 * @brief CART regression tree on a single numeric feature.
 *
 * Splits minimise the weighted sum of squared errors; thresholds sit halfway
 * between neighbouring distinct feature values. Sample weights let callers
 * express bootstrap multiplicities without materialising duplicates.
 */
class RegressionTree {
public:
	/**
	 * @param max_depth Maximum depth of the tree, 0 for unlimited.
	 * @param min_samples_leaf Minimum total weight in each leaf.
	 */
	explicit RegressionTree(int max_depth = 0, double min_samples_leaf = 1.0);

	/**
	 * @brief Grows the tree.
	 * @param x Feature values, sorted in non-decreasing order.
	 * @param y Targets aligned with @p x.
	 * @param weights Non-negative sample weights; empty means all ones.
	 * @throws std::invalid_argument On empty or misaligned input.
	 */
	void fit(const std::vector<double> &x, const std::vector<double> &y, const std::vector<double> &weights = {});

	/// @throws std::runtime_error If called before fit().
	double predict(double x) const;

	std::size_t leafCount() const;
	int depth() const;

private:
	struct Node {
		bool is_leaf = true;
		double value = 0.0;
		double threshold = 0.0;
		std::unique_ptr<Node> left;
		std::unique_ptr<Node> right;
	};

	std::unique_ptr<Node> build(std::size_t begin, std::size_t end, int depth) const;

	static std::size_t countLeaves(const Node *node);
	static int measureDepth(const Node *node);

	int max_depth_;
	double min_samples_leaf_;
	std::vector<double> x_;
	std::vector<double> y_;
	std::vector<double> w_;
	std::unique_ptr<Node> root_;
};

} // namespace estateforecast::models
