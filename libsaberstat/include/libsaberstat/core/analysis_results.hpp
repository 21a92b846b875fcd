#pragma once

#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace libsaberstat {
namespace core {

/**
 * One (group, subject) aggregate
 *
 * Only emitted for count > 0, so mean and std are always defined.
 * std is the sample standard deviation (n-1 denominator), 0 when count = 1.
 */
struct AggregateRow {
	/// Values of the grouping keys, in the order the keys were requested
	std::vector<std::string> group_key;
	std::string subject;
	size_t count = 0;
	double mean = 0.0;
	double std_dev = 0.0;
};

/**
 * A standardized aggregate measure
 *
 * `z_score` is the unclipped standardized mean, `value` the same number
 * clipped to [-bound, +bound].
 */
struct NormalizedMeasure {
	std::vector<std::string> group_key;
	std::string subject;
	double raw_mean = 0.0;
	size_t count = 0;
	double z_score = 0.0;
	double value = 0.0;
	bool clipped = false;
};

/**
 * Value-added result for one entity (or one record at student level)
 *
 * residual = actual - predicted; positive means the entity outperformed
 * what its contextual features predict.
 */
struct ResidualResult {
	std::string entity_id;

	/// Records contributing to this entity's averages
	size_t count = 0;

	double actual = 0.0;
	double predicted = 0.0;
	double residual = 0.0;

	/// Importance per feature of the fit that produced this result (non-negative, sums to 1)
	std::vector<double> feature_importance;
};

/// Greater is strict at the target; GreaterEqual counts the target itself as met
enum class Comparison { Greater, GreaterEqual, Less, Approx };

inline const char *ComparisonSymbol(Comparison op) {
	switch (op) {
	case Comparison::Greater:
		return ">";
	case Comparison::GreaterEqual:
		return "≥";
	case Comparison::Less:
		return "<";
	case Comparison::Approx:
		return "≈";
	default:
		return "?";
	}
}

enum class KpiStatus { Green, Yellow, Red, Unavailable };

inline const char *KpiStatusName(KpiStatus status) {
	switch (status) {
	case KpiStatus::Green:
		return "green";
	case KpiStatus::Yellow:
		return "yellow";
	case KpiStatus::Red:
		return "red";
	case KpiStatus::Unavailable:
	default:
		return "unavailable";
	}
}

/**
 * One named indicator
 *
 * `value` is empty when the indicator could not be computed from the
 * supplied records; `status` is then Unavailable and `unavailable_reason`
 * says why. No value is ever substituted for a missing computation.
 */
struct KpiResult {
	std::string key;
	std::string name;
	std::string description;
	std::string formula;
	std::string unit;

	std::optional<double> value;

	double target = 0.0;
	Comparison comparison = Comparison::Greater;

	/// Width of the yellow band around the target
	double tolerance = 0.0;

	KpiStatus status = KpiStatus::Unavailable;

	/// Observations the value was computed from
	size_t sample_size = 0;

	std::string unavailable_reason;

	/// Intermediate quantities (subgroup means, sizes, signed values)
	std::map<std::string, double> details;

	bool available() const {
		return value.has_value();
	}
};

} // namespace core
} // namespace libsaberstat
