#include "estate-forecast/models/regression_tree.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace estateforecast::models {

namespace {

// Improvements below this are treated as no improvement at all.
constexpr double kMinGain = 1e-12;

} // namespace

RegressionTree::RegressionTree(int max_depth, double min_samples_leaf)
    : max_depth_(max_depth), min_samples_leaf_(min_samples_leaf) {
	if (max_depth_ < 0) {
		throw std::invalid_argument("Tree depth must be non-negative.");
	}
	if (!(min_samples_leaf_ > 0.0)) {
		throw std::invalid_argument("Minimum leaf weight must be positive.");
	}
}

void RegressionTree::fit(const std::vector<double> &x, const std::vector<double> &y,
                         const std::vector<double> &weights) {
	if (x.empty() || x.size() != y.size()) {
		throw std::invalid_argument("Feature and target vectors must be non-empty and equal length.");
	}
	if (!weights.empty() && weights.size() != x.size()) {
		throw std::invalid_argument("Sample weights must align with the feature vector.");
	}
	if (!std::is_sorted(x.begin(), x.end())) {
		throw std::invalid_argument("Feature values must be sorted.");
	}

	x_.clear();
	y_.clear();
	w_.clear();
	for (std::size_t i = 0; i < x.size(); ++i) {
		const double weight = weights.empty() ? 1.0 : weights[i];
		if (weight < 0.0 || !std::isfinite(weight)) {
			throw std::invalid_argument("Sample weights must be finite and non-negative.");
		}
		if (weight == 0.0) {
			continue;
		}
		x_.push_back(x[i]);
		y_.push_back(y[i]);
		w_.push_back(weight);
	}
	if (x_.empty()) {
		throw std::invalid_argument("At least one sample must carry a positive weight.");
	}

	root_ = build(0, x_.size(), 0);
}

std::unique_ptr<RegressionTree::Node> RegressionTree::build(std::size_t begin, std::size_t end, int depth) const {
	auto node = std::make_unique<Node>();

	double total_w = 0.0;
	double total_s = 0.0;
	double total_ss = 0.0;
	for (std::size_t i = begin; i < end; ++i) {
		total_w += w_[i];
		total_s += w_[i] * y_[i];
		total_ss += w_[i] * y_[i] * y_[i];
	}
	node->value = total_s / total_w;

	const bool depth_exhausted = max_depth_ > 0 && depth >= max_depth_;
	if (depth_exhausted || end - begin < 2 || total_w < 2.0 * min_samples_leaf_) {
		return node;
	}

	const double parent_sse = total_ss - total_s * total_s / total_w;
	if (parent_sse <= kMinGain) {
		return node;
	}

	double best_gain = kMinGain;
	std::size_t best_split = end;
	double left_w = 0.0;
	double left_s = 0.0;
	double left_ss = 0.0;
	for (std::size_t i = begin; i + 1 < end; ++i) {
		left_w += w_[i];
		left_s += w_[i] * y_[i];
		left_ss += w_[i] * y_[i] * y_[i];
		if (x_[i] == x_[i + 1]) {
			continue;
		}
		const double right_w = total_w - left_w;
		if (left_w < min_samples_leaf_ || right_w < min_samples_leaf_) {
			continue;
		}
		const double right_s = total_s - left_s;
		const double right_ss = total_ss - left_ss;
		const double child_sse = (left_ss - left_s * left_s / left_w) + (right_ss - right_s * right_s / right_w);
		const double gain = parent_sse - child_sse;
		if (gain > best_gain) {
			best_gain = gain;
			best_split = i + 1;
		}
	}

	if (best_split == end) {
		return node;
	}

	node->is_leaf = false;
	node->threshold = (x_[best_split - 1] + x_[best_split]) / 2.0;
	node->left = build(begin, best_split, depth + 1);
	node->right = build(best_split, end, depth + 1);
	return node;
}

double RegressionTree::predict(double x) const {
	if (!root_) {
		throw std::runtime_error("Predict called before fit.");
	}
	const Node *node = root_.get();
	while (!node->is_leaf) {
		node = x <= node->threshold ? node->left.get() : node->right.get();
	}
	return node->value;
}

std::size_t RegressionTree::leafCount() const {
	return countLeaves(root_.get());
}

int RegressionTree::depth() const {
	return measureDepth(root_.get());
}

std::size_t RegressionTree::countLeaves(const Node *node) {
	if (!node) {
		return 0;
	}
	if (node->is_leaf) {
		return 1;
	}
	return countLeaves(node->left.get()) + countLeaves(node->right.get());
}

int RegressionTree::measureDepth(const Node *node) {
	if (!node || node->is_leaf) {
		return 0;
	}
	return 1 + std::max(measureDepth(node->left.get()), measureDepth(node->right.get()));
}

} // namespace estateforecast::models
