#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace libsaberstat {
namespace utils {

/**
 * Single-pass mean/variance accumulator (Welford)
 *
 * Used by the Aggregator for every (group, subject) cell so that large
 * groups never accumulate sum-of-squares cancellation error.
 */
class RunningStats {
public:
	void Push(double x) {
		n_++;
		double delta = x - mean_;
		mean_ += delta / static_cast<double>(n_);
		m2_ += delta * (x - mean_);
		sum_ += x;
		if (n_ == 1) {
			min_ = x;
			max_ = x;
		} else {
			min_ = std::min(min_, x);
			max_ = std::max(max_, x);
		}
	}

	size_t Count() const {
		return n_;
	}

	double Sum() const {
		return sum_;
	}

	/// Arithmetic mean of the pushed values (NaN when empty)
	double Mean() const {
		return n_ > 0 ? sum_ / static_cast<double>(n_) : std::numeric_limits<double>::quiet_NaN();
	}

	/// Sample variance (n-1); 0 for a single value
	double Variance() const {
		return n_ > 1 ? m2_ / static_cast<double>(n_ - 1) : 0.0;
	}

	double StdDev() const {
		return std::sqrt(Variance());
	}

	double Min() const {
		return min_;
	}

	double Max() const {
		return max_;
	}

private:
	size_t n_ = 0;
	double mean_ = 0.0;
	double m2_ = 0.0;
	double sum_ = 0.0;
	double min_ = 0.0;
	double max_ = 0.0;
};

inline double Mean(const std::vector<double> &values) {
	if (values.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	double sum = 0.0;
	for (double v : values) {
		sum += v;
	}
	return sum / static_cast<double>(values.size());
}

/// Sample standard deviation (n-1); 0 for fewer than two values
inline double SampleStdDev(const std::vector<double> &values) {
	RunningStats stats;
	for (double v : values) {
		stats.Push(v);
	}
	return stats.StdDev();
}

/**
 * Quantile with linear interpolation between closest ranks
 *
 * @param q Probability in [0, 1]
 * @throws std::invalid_argument if values is empty or q is out of range
 */
inline double Quantile(std::vector<double> values, double q) {
	if (values.empty()) {
		throw std::invalid_argument("Quantile of an empty sample");
	}
	if (q < 0.0 || q > 1.0) {
		throw std::invalid_argument("Quantile probability must be in [0, 1] (got " + std::to_string(q) + ")");
	}
	std::sort(values.begin(), values.end());
	double pos = q * static_cast<double>(values.size() - 1);
	size_t lo = static_cast<size_t>(std::floor(pos));
	size_t hi = static_cast<size_t>(std::ceil(pos));
	double frac = pos - static_cast<double>(lo);
	return values[lo] + (values[hi] - values[lo]) * frac;
}

inline double Median(const std::vector<double> &values) {
	return Quantile(values, 0.5);
}

/// Sample standard deviation over mean; NaN when the mean is 0
inline double CoefficientOfVariation(const std::vector<double> &values) {
	double mean = Mean(values);
	if (!std::isfinite(mean) || std::fabs(mean) < 1e-12) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return SampleStdDev(values) / std::fabs(mean);
}

/// Pooled standard deviation of two samples given their sizes and sample std devs
inline double PooledStdDev(size_t n1, double sd1, size_t n2, double sd2) {
	if (n1 == 0 || n2 == 0 || n1 + n2 < 3) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	double num = static_cast<double>(n1 - 1) * sd1 * sd1 + static_cast<double>(n2 - 1) * sd2 * sd2;
	return std::sqrt(num / static_cast<double>(n1 + n2 - 2));
}

} // namespace utils
} // namespace libsaberstat
