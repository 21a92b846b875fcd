#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <vector>

namespace libsaberstat {
namespace core {

/**
 * Result of a linear least-squares fit
 *
 * Layout: when fitted with an intercept, coefficients[0] is the intercept and
 * feature j is at coefficients[j + 1]. Aliased (collinear or constant)
 * features have NaN coefficients and is_aliased = true.
 */
struct RegressionResult {
	// ========================================================================
	// Core regression outputs
	// ========================================================================

	Eigen::VectorXd coefficients;

	double intercept = 0.0;
	bool has_intercept = false;

	/// y - fitted (length = n_obs)
	Eigen::VectorXd residuals;

	/// Rank of the design including the intercept
	size_t rank;

	/// Number of coefficients (features + intercept)
	size_t n_params;

	size_t n_obs;

	std::vector<bool> is_aliased;

	// ========================================================================
	// Fit quality statistics
	// ========================================================================

	/// Coefficient of determination: 1 - SSE/SST, clamped to [0, 1]
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	double adj_r_squared = std::numeric_limits<double>::quiet_NaN();

	/// SSE / (n - rank)
	double mse = std::numeric_limits<double>::quiet_NaN();

	double rmse = std::numeric_limits<double>::quiet_NaN();

	RegressionResult() : rank(0), n_params(0), n_obs(0) {
	}

	RegressionResult(size_t n_obs_, size_t n_params_, size_t rank_) : rank(rank_), n_params(n_params_), n_obs(n_obs_) {
		coefficients =
		    Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n_params_), std::numeric_limits<double>::quiet_NaN());
		residuals = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_obs_));
		is_aliased.resize(n_params_, true);
	}

	size_t df_residual() const {
		if (n_obs <= rank) return 0;
		return n_obs - rank;
	}

	/// Coefficient of feature column j (NaN if aliased)
	double FeatureCoefficient(size_t j) const {
		size_t idx = has_intercept ? j + 1 : j;
		if (idx >= n_params) {
			return std::numeric_limits<double>::quiet_NaN();
		}
		return coefficients[static_cast<Eigen::Index>(idx)];
	}

	bool is_valid() const {
		if (rank == 0 || n_params == 0 || n_obs == 0) return false;

		for (size_t i = 0; i < n_params; i++) {
			if (!is_aliased[i] && !std::isfinite(coefficients[static_cast<Eigen::Index>(i)])) {
				return false;
			}
		}
		return true;
	}
};

} // namespace core
} // namespace libsaberstat
