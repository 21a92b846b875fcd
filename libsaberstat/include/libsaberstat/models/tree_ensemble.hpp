#pragma once

#include "libsaberstat/core/analysis_options.hpp"
#include "libsaberstat/models/regression_tree.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace libsaberstat {
namespace models {

/**
 * IEnsembleRegressor: common contract of the tree-ensemble models
 *
 * The residual engine only needs fit, predict and feature importances, so
 * the model kind is a runtime choice made through CreateEnsemble().
 */
class IEnsembleRegressor {
public:
	virtual ~IEnsembleRegressor() = default;

	/// Model identifier ("random_forest", "gradient_boosting")
	virtual std::string GetType() const = 0;

	/**
	 * Fit on all rows of X
	 *
	 * @throws std::invalid_argument on dimension mismatch or empty input
	 */
	virtual void Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) = 0;

	/// @throws std::runtime_error if called before Fit()
	virtual Eigen::VectorXd Predict(const Eigen::MatrixXd &X) const = 0;

	/**
	 * Impurity-decrease importances, non-negative and summing to 1
	 *
	 * Uniform when no tree ever split.
	 */
	virtual std::vector<double> FeatureImportance() const = 0;

	virtual bool IsFitted() const = 0;
};

/// Normalize raw gains to sum 1 (uniform when the total is 0)
inline std::vector<double> NormalizeImportance(const std::vector<double> &raw) {
	std::vector<double> out(raw.size(), 0.0);
	if (raw.empty()) {
		return out;
	}
	double total = 0.0;
	for (double v : raw) {
		total += std::max(0.0, v);
	}
	for (size_t i = 0; i < raw.size(); i++) {
		out[i] = total > 0.0 ? std::max(0.0, raw[i]) / total : 1.0 / static_cast<double>(raw.size());
	}
	return out;
}

inline void CheckTrainingData(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
	if (X.rows() != y.size()) {
		throw std::invalid_argument("Ensemble fit: X has " + std::to_string(X.rows()) + " rows but y has " +
		                            std::to_string(y.size()));
	}
	if (X.rows() == 0 || X.cols() == 0) {
		throw std::invalid_argument("Ensemble fit: empty design matrix");
	}
}

/**
 * Random forest: bootstrap-aggregated CART trees
 *
 * Every bootstrap sample is drawn from a single generator seeded once, so
 * a given seed reproduces the same forest.
 */
class RandomForestRegressor : public IEnsembleRegressor {
public:
	explicit RandomForestRegressor(const core::EnsembleOptions &options) : options_(options) {
		options_.Validate();
	}

	std::string GetType() const override {
		return "random_forest";
	}

	void Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) override {
		CheckTrainingData(X, y);
		const size_t n = static_cast<size_t>(X.rows());
		TreeParams params {options_.max_depth, options_.min_samples_split, options_.min_samples_leaf};

		std::mt19937 rng(options_.seed);
		std::uniform_int_distribution<size_t> pick(0, n - 1);
		std::vector<size_t> all_rows(n);
		for (size_t i = 0; i < n; i++) {
			all_rows[i] = i;
		}

		trees_.assign(options_.n_estimators, RegressionTree());
		raw_importance_.assign(static_cast<size_t>(X.cols()), 0.0);
		std::vector<size_t> sample(n);
		for (auto &tree : trees_) {
			if (options_.bootstrap) {
				for (size_t i = 0; i < n; i++) {
					sample[i] = pick(rng);
				}
				tree.Fit(X, y, sample, params, raw_importance_);
			} else {
				tree.Fit(X, y, all_rows, params, raw_importance_);
			}
		}
	}

	Eigen::VectorXd Predict(const Eigen::MatrixXd &X) const override {
		if (trees_.empty()) {
			throw std::runtime_error("RandomForestRegressor: predict called before fit");
		}
		Eigen::VectorXd sum = Eigen::VectorXd::Zero(X.rows());
		for (const auto &tree : trees_) {
			sum += tree.Predict(X);
		}
		return sum / static_cast<double>(trees_.size());
	}

	std::vector<double> FeatureImportance() const override {
		return NormalizeImportance(raw_importance_);
	}

	bool IsFitted() const override {
		return !trees_.empty();
	}

	size_t TreeCount() const {
		return trees_.size();
	}

private:
	core::EnsembleOptions options_;
	std::vector<RegressionTree> trees_;
	std::vector<double> raw_importance_;
};

/**
 * Gradient boosting with squared loss
 *
 * F0 = mean(y); each stage fits a tree to the current residuals and adds
 * learning_rate * tree to F.
 */
class GradientBoostingRegressor : public IEnsembleRegressor {
public:
	explicit GradientBoostingRegressor(const core::EnsembleOptions &options) : options_(options) {
		options_.Validate();
	}

	std::string GetType() const override {
		return "gradient_boosting";
	}

	void Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) override {
		CheckTrainingData(X, y);
		const size_t n = static_cast<size_t>(X.rows());
		TreeParams params {options_.max_depth, options_.min_samples_split, options_.min_samples_leaf};

		std::vector<size_t> all_rows(n);
		for (size_t i = 0; i < n; i++) {
			all_rows[i] = i;
		}

		initial_ = y.mean();
		Eigen::VectorXd current = Eigen::VectorXd::Constant(y.size(), initial_);
		stages_.assign(options_.n_estimators, RegressionTree());
		raw_importance_.assign(static_cast<size_t>(X.cols()), 0.0);

		for (auto &stage : stages_) {
			Eigen::VectorXd residual = y - current;
			stage.Fit(X, residual, all_rows, params, raw_importance_);
			current += options_.learning_rate * stage.Predict(X);
		}
		fitted_ = true;
	}

	Eigen::VectorXd Predict(const Eigen::MatrixXd &X) const override {
		if (!fitted_) {
			throw std::runtime_error("GradientBoostingRegressor: predict called before fit");
		}
		Eigen::VectorXd out = Eigen::VectorXd::Constant(X.rows(), initial_);
		for (const auto &stage : stages_) {
			out += options_.learning_rate * stage.Predict(X);
		}
		return out;
	}

	std::vector<double> FeatureImportance() const override {
		return NormalizeImportance(raw_importance_);
	}

	bool IsFitted() const override {
		return fitted_;
	}

private:
	core::EnsembleOptions options_;
	double initial_ = 0.0;
	bool fitted_ = false;
	std::vector<RegressionTree> stages_;
	std::vector<double> raw_importance_;
};

/// @throws std::invalid_argument if the options are invalid
inline std::unique_ptr<IEnsembleRegressor> CreateEnsemble(const core::EnsembleOptions &options) {
	switch (options.type) {
	case core::EnsembleType::GradientBoosting:
		return std::make_unique<GradientBoostingRegressor>(options);
	case core::EnsembleType::RandomForest:
	default:
		return std::make_unique<RandomForestRegressor>(options);
	}
}

} // namespace models
} // namespace libsaberstat
