#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace libsaberstat {
namespace metrics {

/// Goodness of fit of predictions against observed values
struct FitMetrics {
	double r_squared = std::numeric_limits<double>::quiet_NaN();
	double mae = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	size_t n = 0;
};

/**
 * R², MAE and RMSE of `predicted` against `actual`
 *
 * R² is 1 - SSE/SST and is not clamped (a holdout can score below 0).
 * A constant `actual` has no variance to explain; R² is reported as 0.
 *
 * @throws std::invalid_argument if sizes differ or the input is empty
 */
inline FitMetrics ComputeFitMetrics(const Eigen::VectorXd &actual, const Eigen::VectorXd &predicted) {
	if (actual.size() != predicted.size()) {
		throw std::invalid_argument("Fit metrics: " + std::to_string(actual.size()) + " actual values but " +
		                            std::to_string(predicted.size()) + " predictions");
	}
	if (actual.size() == 0) {
		throw std::invalid_argument("Fit metrics: empty input");
	}

	FitMetrics m;
	m.n = static_cast<size_t>(actual.size());
	Eigen::VectorXd err = actual - predicted;
	double ss_res = err.squaredNorm();
	double ss_tot = (actual.array() - actual.mean()).square().sum();

	m.r_squared = ss_tot > 1e-12 ? 1.0 - ss_res / ss_tot : 0.0;
	m.mae = err.cwiseAbs().mean();
	m.rmse = std::sqrt(ss_res / static_cast<double>(m.n));
	return m;
}

} // namespace metrics
} // namespace libsaberstat
