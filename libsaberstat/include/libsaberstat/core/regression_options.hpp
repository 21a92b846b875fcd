#pragma once

#include <stdexcept>
#include <string>

namespace libsaberstat {
namespace core {

/**
 * Options for the linear least-squares solver
 *
 * Used by the indicators that are defined as linear fits (EALG, GNCTP)
 * and by the yearly trend projection.
 */
struct RegressionOptions {
	/// Include intercept term in regression
	/// Default: true
	bool intercept = true;

	/// QR decomposition rank tolerance (-1 = auto, use Eigen default)
	/// Default: -1.0 (auto)
	double qr_tolerance = -1.0;

	RegressionOptions() = default;

	static RegressionOptions OLS(bool intercept_ = true) {
		RegressionOptions opts;
		opts.intercept = intercept_;
		return opts;
	}

	/**
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (qr_tolerance == 0.0) {
			throw std::invalid_argument("qr_tolerance must be positive or -1 for auto (got 0)");
		}
	}
};

} // namespace core
} // namespace libsaberstat
