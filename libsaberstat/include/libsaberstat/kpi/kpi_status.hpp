#pragma once

#include "libsaberstat/core/analysis_results.hpp"
#include <cmath>
#include <string>

namespace libsaberstat {
namespace kpi {

/// Static metadata of an indicator
struct KpiDefinition {
	std::string key;
	std::string name;
	std::string description;
	std::string formula;
	std::string unit;
	double target = 0.0;
	core::Comparison comparison = core::Comparison::Greater;
	double tolerance = 0.0;
};

/**
 * Threshold an indicator value against its target
 *
 * '>': green above target, yellow within tolerance below it, red otherwise.
 * '≥': green at or above target, yellow at or above target - tolerance, red otherwise.
 * '<': green below target, yellow within tolerance above it, red otherwise.
 * '≈': green within tolerance of target, yellow within twice the tolerance.
 */
inline core::KpiStatus ClassifyStatus(double value, double target, core::Comparison op, double tolerance) {
	if (!std::isfinite(value)) {
		return core::KpiStatus::Unavailable;
	}
	switch (op) {
	case core::Comparison::Greater:
		if (value > target) return core::KpiStatus::Green;
		if (value > target - tolerance) return core::KpiStatus::Yellow;
		return core::KpiStatus::Red;
	case core::Comparison::GreaterEqual:
		if (value >= target) return core::KpiStatus::Green;
		if (value >= target - tolerance) return core::KpiStatus::Yellow;
		return core::KpiStatus::Red;
	case core::Comparison::Less:
		if (value < target) return core::KpiStatus::Green;
		if (value < target + tolerance) return core::KpiStatus::Yellow;
		return core::KpiStatus::Red;
	case core::Comparison::Approx:
	default: {
		double distance = std::fabs(value - target);
		if (distance <= tolerance) return core::KpiStatus::Green;
		if (distance <= 2.0 * tolerance) return core::KpiStatus::Yellow;
		return core::KpiStatus::Red;
	}
	}
}

inline core::KpiResult MakeKpi(const KpiDefinition &def) {
	core::KpiResult result;
	result.key = def.key;
	result.name = def.name;
	result.description = def.description;
	result.formula = def.formula;
	result.unit = def.unit;
	result.target = def.target;
	result.comparison = def.comparison;
	result.tolerance = def.tolerance;
	return result;
}

/// Result carrying a value; status is derived from the definition's threshold
inline core::KpiResult MakeAvailable(const KpiDefinition &def, double value, size_t sample_size) {
	core::KpiResult result = MakeKpi(def);
	result.value = value;
	result.sample_size = sample_size;
	result.status = ClassifyStatus(value, def.target, def.comparison, def.tolerance);
	return result;
}

/// Result without a value; status stays Unavailable
inline core::KpiResult MakeUnavailable(const KpiDefinition &def, const std::string &reason, size_t sample_size = 0) {
	core::KpiResult result = MakeKpi(def);
	result.unavailable_reason = reason;
	result.sample_size = sample_size;
	return result;
}

} // namespace kpi
} // namespace libsaberstat
