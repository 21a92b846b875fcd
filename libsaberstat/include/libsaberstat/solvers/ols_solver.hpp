#pragma once

#include "libsaberstat/core/regression_options.hpp"
#include "libsaberstat/core/regression_result.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace libsaberstat {
namespace solvers {

/**
 * Ordinary Least Squares solver with rank-deficiency handling
 *
 * Categorical designs built from one-hot dummies are frequently collinear
 * (a stratum that only occurs in rural schools, a dummy that is constant
 * after filtering). Column-pivoted QR keeps such fits well defined:
 * aliased columns get NaN coefficients and do not contribute to the fit.
 *
 * Algorithm:
 * 1. Center X and y when fitting an intercept (intercept is never aliased)
 * 2. QR decomposition with column pivoting: X*P = Q*R
 * 3. Solve the rank-r triangular system and map back through P
 * 4. Recover the intercept from the means
 * 5. Compute residuals, R², adjusted R², MSE, RMSE
 *
 * Stateless; all methods are static.
 */
class OLSSolver {
public:
	/**
	 * Fit OLS regression
	 *
	 * @param y Response vector (length n)
	 * @param X Design matrix (n × p)
	 * @param options Regression options
	 * @return RegressionResult (coefficients[0] is the intercept when fitted)
	 * @throws std::invalid_argument on dimension mismatch or fewer than 2 observations
	 */
	static core::RegressionResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                  const core::RegressionOptions &options = core::RegressionOptions::OLS());

	/**
	 * Apply a fitted model to new rows; aliased features are ignored
	 *
	 * @throws std::invalid_argument if X has a different column count than the fit
	 */
	static Eigen::VectorXd Predict(const core::RegressionResult &fit, const Eigen::MatrixXd &X);

private:
	static void ComputeStatistics(const Eigen::VectorXd &y, const Eigen::VectorXd &residuals, size_t rank, size_t n,
	                              core::RegressionResult &result);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::RegressionResult OLSSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                             const core::RegressionOptions &options) {
	options.Validate();

	const size_t n = static_cast<size_t>(X.rows());
	const size_t p = static_cast<size_t>(X.cols());

	if (static_cast<size_t>(y.size()) != n) {
		throw std::invalid_argument("OLS: y has " + std::to_string(y.size()) + " rows but X has " +
		                            std::to_string(n));
	}
	if (n < 2) {
		throw std::invalid_argument("OLS: need at least 2 observations (got " + std::to_string(n) + ")");
	}

	Eigen::MatrixXd X_work;
	Eigen::VectorXd y_work;
	Eigen::VectorXd x_means;
	double y_mean = 0.0;

	if (options.intercept) {
		y_mean = y.mean();
		x_means = X.colwise().mean();
		y_work = y.array() - y_mean;
		X_work = X.rowwise() - x_means.transpose();
	} else {
		X_work = X;
		y_work = y;
		x_means = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(p));
	}

	const size_t n_params = options.intercept ? p + 1 : p;
	const size_t coef_offset = options.intercept ? 1 : 0;
	core::RegressionResult result(n, n_params, 0);

	size_t feature_rank = 0;
	if (p > 0) {
		Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X_work);
		if (options.qr_tolerance > 0.0) {
			qr.setThreshold(options.qr_tolerance);
		}
		feature_rank = static_cast<size_t>(qr.rank());
		const auto &P = qr.colsPermutation();

		if (feature_rank > 0) {
			Eigen::VectorXd QtY = qr.householderQ().transpose() * y_work;
			Eigen::MatrixXd R_reduced = qr.matrixQR().topLeftCorner(static_cast<Eigen::Index>(feature_rank),
			                                                        static_cast<Eigen::Index>(feature_rank));
			Eigen::VectorXd coef_reduced =
			    R_reduced.triangularView<Eigen::Upper>().solve(QtY.head(static_cast<Eigen::Index>(feature_rank)));

			for (size_t i = 0; i < feature_rank; i++) {
				auto i_idx = static_cast<Eigen::Index>(i);
				size_t original_idx = static_cast<size_t>(P.indices()[i_idx]);
				result.coefficients[static_cast<Eigen::Index>(original_idx + coef_offset)] = coef_reduced[i_idx];
				result.is_aliased[original_idx + coef_offset] = false;
			}
		}
	}

	result.rank = feature_rank + (options.intercept ? 1 : 0);

	if (options.intercept) {
		double intercept = y_mean;
		for (size_t j = 0; j < p; j++) {
			if (!result.is_aliased[j + 1]) {
				intercept -= result.coefficients[static_cast<Eigen::Index>(j + 1)] * x_means(static_cast<Eigen::Index>(j));
			}
		}
		result.coefficients[0] = intercept;
		result.is_aliased[0] = false;
		result.intercept = intercept;
		result.has_intercept = true;
	}

	result.residuals = y - Predict(result, X);
	ComputeStatistics(y, result.residuals, result.rank, n, result);

	return result;
}

inline Eigen::VectorXd OLSSolver::Predict(const core::RegressionResult &fit, const Eigen::MatrixXd &X) {
	const size_t p = fit.has_intercept ? fit.n_params - 1 : fit.n_params;
	if (static_cast<size_t>(X.cols()) != p) {
		throw std::invalid_argument("OLS predict: expected " + std::to_string(p) + " feature columns (got " +
		                            std::to_string(X.cols()) + ")");
	}
	Eigen::VectorXd y_pred = Eigen::VectorXd::Constant(X.rows(), fit.has_intercept ? fit.intercept : 0.0);
	const size_t offset = fit.has_intercept ? 1 : 0;
	for (size_t j = 0; j < p; j++) {
		const auto coef_idx = static_cast<Eigen::Index>(j + offset);
		if (!fit.is_aliased[j + offset] && std::isfinite(fit.coefficients[coef_idx])) {
			y_pred += fit.coefficients[coef_idx] * X.col(static_cast<Eigen::Index>(j));
		}
	}
	return y_pred;
}

inline void OLSSolver::ComputeStatistics(const Eigen::VectorXd &y, const Eigen::VectorXd &residuals, size_t rank,
                                         size_t n, core::RegressionResult &result) {
	double ss_res = residuals.squaredNorm();
	double y_mean = y.mean();
	double ss_tot = (y.array() - y_mean).square().sum();

	result.r_squared = (ss_tot > 1e-10) ? (1.0 - ss_res / ss_tot) : 0.0;

	// Numerical noise in rank-deficient fits can leave R² slightly outside [0, 1]
	if (result.r_squared < 0.0) {
		result.r_squared = 0.0;
	} else if (result.r_squared > 1.0) {
		result.r_squared = 1.0;
	}

	if (n > rank + 1) {
		double adj_factor = static_cast<double>(n - 1) / static_cast<double>(n - rank);
		result.adj_r_squared = std::max(0.0, std::min(1.0, 1.0 - (1.0 - result.r_squared) * adj_factor));
	} else {
		result.adj_r_squared = result.r_squared;
	}

	if (n > rank) {
		result.mse = ss_res / static_cast<double>(n - rank);
	} else {
		// Saturated model: no residual degrees of freedom
		result.mse = std::numeric_limits<double>::quiet_NaN();
	}
	result.rmse = std::sqrt(result.mse);
}

} // namespace solvers
} // namespace libsaberstat
