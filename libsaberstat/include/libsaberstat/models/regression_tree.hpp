#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace libsaberstat {
namespace models {

struct TreeParams {
	size_t max_depth = 10;
	size_t min_samples_split = 2;
	size_t min_samples_leaf = 1;
};

/**
 * CART regression tree (variance reduction, axis-aligned thresholds)
 *
 * Split search sorts the node's samples on each feature and sweeps the
 * candidate thresholds with running sums, so a node costs O(p n log n).
 * Thresholds sit midway between consecutive distinct values, which for
 * label-encoded categoricals separates codes <= k from codes > k.
 *
 * The SSE decrease of every split is added to `importance[feature]`, which
 * the ensembles normalize into feature importances.
 */
class RegressionTree {
public:
	/**
	 * Grow the tree on the given rows of X (rows may repeat, as in a bootstrap sample)
	 *
	 * @param importance Accumulator of length X.cols(), updated in place
	 * @throws std::invalid_argument on dimension mismatch or an empty sample
	 */
	void Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, const std::vector<size_t> &rows,
	         const TreeParams &params, std::vector<double> &importance);

	double PredictRow(const Eigen::MatrixXd &X, Eigen::Index row) const;

	Eigen::VectorXd Predict(const Eigen::MatrixXd &X) const {
		Eigen::VectorXd out(X.rows());
		for (Eigen::Index i = 0; i < X.rows(); i++) {
			out[i] = PredictRow(X, i);
		}
		return out;
	}

	size_t NodeCount() const {
		return nodes_.size();
	}

	size_t LeafCount() const {
		size_t n = 0;
		for (const auto &node : nodes_) {
			n += node.feature < 0 ? 1 : 0;
		}
		return n;
	}

	size_t Depth() const {
		return depth_;
	}

private:
	struct Node {
		/// -1 for leaves
		int feature = -1;
		double threshold = 0.0;
		int left = -1;
		int right = -1;
		double value = 0.0;
	};

	std::vector<Node> nodes_;
	size_t depth_ = 0;

	int Build(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, std::vector<size_t> &rows, size_t depth,
	          const TreeParams &params, std::vector<double> &importance);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void RegressionTree::Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, const std::vector<size_t> &rows,
                                const TreeParams &params, std::vector<double> &importance) {
	if (X.rows() != y.size()) {
		throw std::invalid_argument("RegressionTree: X has " + std::to_string(X.rows()) + " rows but y has " +
		                            std::to_string(y.size()));
	}
	if (rows.empty()) {
		throw std::invalid_argument("RegressionTree: cannot fit on an empty sample");
	}
	if (importance.size() != static_cast<size_t>(X.cols())) {
		importance.assign(static_cast<size_t>(X.cols()), 0.0);
	}
	nodes_.clear();
	depth_ = 0;
	std::vector<size_t> work = rows;
	Build(X, y, work, 0, params, importance);
}

inline int RegressionTree::Build(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, std::vector<size_t> &rows,
                                 size_t depth, const TreeParams &params, std::vector<double> &importance) {
	const size_t n = rows.size();
	double sum = 0.0;
	double sum_sq = 0.0;
	for (size_t r : rows) {
		double v = y[static_cast<Eigen::Index>(r)];
		sum += v;
		sum_sq += v * v;
	}
	const double mean = sum / static_cast<double>(n);
	const double node_sse = std::max(0.0, sum_sq - sum * sum / static_cast<double>(n));

	const int index = static_cast<int>(nodes_.size());
	nodes_.push_back(Node());
	nodes_[static_cast<size_t>(index)].value = mean;
	depth_ = std::max(depth_, depth);

	if (depth >= params.max_depth || n < params.min_samples_split || n < 2 * params.min_samples_leaf ||
	    node_sse <= 1e-12) {
		return index;
	}

	int best_feature = -1;
	double best_threshold = 0.0;
	double best_gain = 0.0;
	std::vector<size_t> order(rows);

	for (Eigen::Index f = 0; f < X.cols(); f++) {
		std::sort(order.begin(), order.end(), [&X, f](size_t a, size_t b) {
			return X(static_cast<Eigen::Index>(a), f) < X(static_cast<Eigen::Index>(b), f);
		});

		double left_sum = 0.0;
		double left_sq = 0.0;
		for (size_t i = 0; i + 1 < n; i++) {
			double v = y[static_cast<Eigen::Index>(order[i])];
			left_sum += v;
			left_sq += v * v;

			const size_t n_left = i + 1;
			const size_t n_right = n - n_left;
			if (n_left < params.min_samples_leaf || n_right < params.min_samples_leaf) {
				continue;
			}
			double x_here = X(static_cast<Eigen::Index>(order[i]), f);
			double x_next = X(static_cast<Eigen::Index>(order[i + 1]), f);
			if (x_next <= x_here) {
				continue;
			}

			double right_sum = sum - left_sum;
			double right_sq = sum_sq - left_sq;
			double left_sse = left_sq - left_sum * left_sum / static_cast<double>(n_left);
			double right_sse = right_sq - right_sum * right_sum / static_cast<double>(n_right);
			double gain = node_sse - left_sse - right_sse;
			if (gain > best_gain + 1e-12) {
				best_gain = gain;
				best_feature = static_cast<int>(f);
				best_threshold = 0.5 * (x_here + x_next);
			}
		}
	}

	if (best_feature < 0) {
		return index;
	}

	std::vector<size_t> left_rows;
	std::vector<size_t> right_rows;
	for (size_t r : rows) {
		if (X(static_cast<Eigen::Index>(r), best_feature) <= best_threshold) {
			left_rows.push_back(r);
		} else {
			right_rows.push_back(r);
		}
	}
	importance[static_cast<size_t>(best_feature)] += best_gain;

	// Children are built after the parent is stored; nodes_ may reallocate, so index by position
	int left = Build(X, y, left_rows, depth + 1, params, importance);
	int right = Build(X, y, right_rows, depth + 1, params, importance);
	Node &node = nodes_[static_cast<size_t>(index)];
	node.feature = best_feature;
	node.threshold = best_threshold;
	node.left = left;
	node.right = right;
	return index;
}

inline double RegressionTree::PredictRow(const Eigen::MatrixXd &X, Eigen::Index row) const {
	if (nodes_.empty()) {
		throw std::runtime_error("RegressionTree: predict called before fit");
	}
	size_t current = 0;
	while (nodes_[current].feature >= 0) {
		const Node &node = nodes_[current];
		current = static_cast<size_t>(X(row, node.feature) <= node.threshold ? node.left : node.right);
	}
	return nodes_[current].value;
}

} // namespace models
} // namespace libsaberstat
