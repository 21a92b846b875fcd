#pragma once

#include "libsaberstat/aggregation/aggregator.hpp"
#include "libsaberstat/core/analysis_options.hpp"
#include "libsaberstat/core/student_record.hpp"
#include "libsaberstat/ranking/ranking.hpp"
#include "libsaberstat/solvers/ols_solver.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace libsaberstat {
namespace temporal {

/// One entity's mean in two years
struct EntityChange {
	std::string entity_id;
	double start_value = 0.0;
	double end_value = 0.0;
	double change = 0.0;
	/// Relative change in percent; empty when the start value is 0
	std::optional<double> change_pct;
	size_t start_count = 0;
	size_t end_count = 0;
};

struct YearComparison {
	int year_start = 0;
	int year_end = 0;
	std::string subject;

	/// Entities present in both years, ordered by entity id
	std::vector<EntityChange> changes;

	size_t only_in_start = 0;
	size_t only_in_end = 0;

	core::DiagnosticList diagnostics;

	double MeanChange() const {
		if (changes.empty()) {
			return std::numeric_limits<double>::quiet_NaN();
		}
		double sum = 0.0;
		for (const auto &c : changes) {
			sum += c.change;
		}
		return sum / static_cast<double>(changes.size());
	}
};

struct YearlyMean {
	int year = 0;
	double mean = 0.0;
	size_t count = 0;
};

struct TrendProjection {
	bool available = false;
	std::string unavailable_reason;
	double slope = 0.0;
	double intercept = 0.0;
	double r_squared = 0.0;
	/// (year, projected mean) for the years after the last observed one
	std::vector<std::pair<int, double>> projected;
};

/**
 * ChangeAnalysis: year-over-year movement of entity means
 *
 * Feeds the "most improved" / "most declined" rankings and the national
 * trend projection. Means come from the Aggregator with "year" appended to
 * the entity keys, so the same sentinel and missing-key rules apply.
 */
class ChangeAnalysis {
public:
	/**
	 * Pair aggregate rows of the same entity across two years
	 *
	 * @param rows Aggregate rows carrying entity and year columns in their group key
	 * @param entity_key_positions Group key positions forming the entity id
	 * @param year_position Group key position holding the year
	 * @throws std::invalid_argument if the years are equal or a position is out of range
	 */
	static YearComparison CompareYears(const std::vector<core::AggregateRow> &rows,
	                                   const std::vector<size_t> &entity_key_positions, size_t year_position,
	                                   const std::string &subject, int year_start, int year_end);

	/// Aggregates by entity_keys + year, then pairs the two years
	static YearComparison CompareYears(const core::RecordSet &records, const std::vector<std::string> &entity_keys,
	                                   const std::string &subject, int year_start, int year_end,
	                                   const core::AggregationOptions &options = core::AggregationOptions());

	/// Ranking entries keyed by entity, valued by absolute or percent change
	static std::vector<ranking::RankedEntry> ToRanked(const std::vector<EntityChange> &changes,
	                                                  bool use_percent = false);

	/// Mean of the subject per year, ascending by year; records without a year are skipped
	static std::vector<YearlyMean> YearlyMeans(const core::RecordSet &records, const std::string &subject);

	/**
	 * Linear trend of yearly means, projected `horizon` years past the last year
	 *
	 * Requires at least 3 distinct years; otherwise returns an unavailable projection.
	 */
	static TrendProjection ProjectTrend(const std::vector<YearlyMean> &yearly, size_t horizon = 3);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline YearComparison ChangeAnalysis::CompareYears(const std::vector<core::AggregateRow> &rows,
                                                   const std::vector<size_t> &entity_key_positions,
                                                   size_t year_position, const std::string &subject,
                                                   int year_start, int year_end) {
	if (year_start == year_end) {
		throw std::invalid_argument("CompareYears: start and end year must differ (got " +
		                            std::to_string(year_start) + ")");
	}

	YearComparison comparison;
	comparison.year_start = year_start;
	comparison.year_end = year_end;
	comparison.subject = subject;

	const std::string start_text = std::to_string(year_start);
	const std::string end_text = std::to_string(year_end);
	std::map<std::string, const core::AggregateRow *> start_rows;
	std::map<std::string, const core::AggregateRow *> end_rows;
	for (const auto &row : rows) {
		if (row.subject != subject) {
			continue;
		}
		if (year_position >= row.group_key.size()) {
			throw std::invalid_argument("CompareYears: year position out of range (got " +
			                            std::to_string(year_position) + ")");
		}
		std::vector<std::string> entity;
		for (size_t pos : entity_key_positions) {
			if (pos >= row.group_key.size()) {
				throw std::invalid_argument("CompareYears: entity key position out of range (got " +
				                            std::to_string(pos) + ")");
			}
			entity.push_back(row.group_key[pos]);
		}
		const std::string &year = row.group_key[year_position];
		if (year == start_text) {
			start_rows[core::JoinKey(entity)] = &row;
		} else if (year == end_text) {
			end_rows[core::JoinKey(entity)] = &row;
		}
	}

	for (const auto &entry : start_rows) {
		auto it = end_rows.find(entry.first);
		if (it == end_rows.end()) {
			comparison.only_in_start++;
			continue;
		}
		EntityChange change;
		change.entity_id = entry.first;
		change.start_value = entry.second->mean;
		change.end_value = it->second->mean;
		change.change = change.end_value - change.start_value;
		if (std::fabs(change.start_value) > 1e-12) {
			change.change_pct = 100.0 * change.change / change.start_value;
		}
		change.start_count = entry.second->count;
		change.end_count = it->second->count;
		comparison.changes.push_back(change);
	}
	for (const auto &entry : end_rows) {
		if (start_rows.find(entry.first) == start_rows.end()) {
			comparison.only_in_end++;
		}
	}
	return comparison;
}

inline YearComparison ChangeAnalysis::CompareYears(const core::RecordSet &records,
                                                   const std::vector<std::string> &entity_keys,
                                                   const std::string &subject, int year_start, int year_end,
                                                   const core::AggregationOptions &options) {
	std::vector<std::string> keys = entity_keys;
	keys.push_back("year");
	auto table = aggregation::Aggregator::Aggregate(records, keys, {subject}, options);

	std::vector<size_t> positions(entity_keys.size());
	for (size_t i = 0; i < positions.size(); i++) {
		positions[i] = i;
	}
	auto comparison = CompareYears(table.rows, positions, entity_keys.size(), subject, year_start, year_end);
	comparison.diagnostics = table.diagnostics;
	return comparison;
}

inline std::vector<ranking::RankedEntry> ChangeAnalysis::ToRanked(const std::vector<EntityChange> &changes,
                                                                  bool use_percent) {
	std::vector<ranking::RankedEntry> out;
	for (const auto &c : changes) {
		if (use_percent && !c.change_pct) {
			continue;
		}
		out.push_back(ranking::RankedEntry {c.entity_id, use_percent ? *c.change_pct : c.change, c.end_count});
	}
	return out;
}

inline std::vector<YearlyMean> ChangeAnalysis::YearlyMeans(const core::RecordSet &records,
                                                           const std::string &subject) {
	auto table = aggregation::Aggregator::Aggregate(records, {"year"}, {subject});
	std::vector<YearlyMean> out;
	for (const auto &row : table.rows) {
		out.push_back(YearlyMean {std::stoi(row.group_key[0]), row.mean, row.count});
	}
	// Group keys sort as strings
	std::sort(out.begin(), out.end(), [](const YearlyMean &a, const YearlyMean &b) { return a.year < b.year; });
	return out;
}

inline TrendProjection ChangeAnalysis::ProjectTrend(const std::vector<YearlyMean> &yearly, size_t horizon) {
	TrendProjection projection;
	std::set<int> years;
	for (const auto &point : yearly) {
		years.insert(point.year);
	}
	if (years.size() < 3) {
		projection.unavailable_reason =
		    "at least 3 years are required for a projection (got " + std::to_string(years.size()) + ")";
		return projection;
	}

	const auto n = static_cast<Eigen::Index>(yearly.size());
	Eigen::MatrixXd X(n, 1);
	Eigen::VectorXd y(n);
	int last_year = yearly.front().year;
	for (Eigen::Index i = 0; i < n; i++) {
		const auto &point = yearly[static_cast<size_t>(i)];
		X(i, 0) = static_cast<double>(point.year);
		y[i] = point.mean;
		last_year = std::max(last_year, point.year);
	}

	auto fit = solvers::OLSSolver::Fit(y, X);
	if (!std::isfinite(fit.FeatureCoefficient(0))) {
		projection.unavailable_reason = "years do not vary";
		return projection;
	}

	projection.available = true;
	projection.slope = fit.FeatureCoefficient(0);
	projection.intercept = fit.intercept;
	projection.r_squared = fit.r_squared;
	for (size_t h = 1; h <= horizon; h++) {
		int year = last_year + static_cast<int>(h);
		projection.projected.emplace_back(year, projection.intercept + projection.slope * static_cast<double>(year));
	}
	return projection;
}

} // namespace temporal
} // namespace libsaberstat
