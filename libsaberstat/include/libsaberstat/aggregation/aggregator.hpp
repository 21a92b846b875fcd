#pragma once

#include "libsaberstat/core/analysis_options.hpp"
#include "libsaberstat/core/analysis_results.hpp"
#include "libsaberstat/core/diagnostic.hpp"
#include "libsaberstat/core/entity_level.hpp"
#include "libsaberstat/core/student_record.hpp"
#include "libsaberstat/utils/descriptive_stats.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace libsaberstat {
namespace aggregation {

/// A (group, subject) cell that had values but fewer than the configured floor
struct WithheldGroup {
	std::vector<std::string> group_key;
	std::string subject;
	size_t count = 0;
};

struct AggregationResult {
	std::vector<std::string> group_keys;
	std::vector<std::string> subjects;

	/// Rows ordered by group key tuple, then by requested subject order
	std::vector<core::AggregateRow> rows;

	/// Records excluded because a grouping key was missing
	size_t excluded_missing_key = 0;

	std::vector<WithheldGroup> withheld;

	core::DiagnosticList diagnostics;

	/// Number of distinct groups that produced at least one row
	size_t GroupCount() const {
		std::set<std::vector<std::string>> groups;
		for (const auto &row : rows) {
			groups.insert(row.group_key);
		}
		return groups.size();
	}

	/// Rows of one subject, preserving order
	std::vector<core::AggregateRow> RowsForSubject(const std::string &subject) const {
		std::vector<core::AggregateRow> out;
		for (const auto &row : rows) {
			if (row.subject == subject) {
				out.push_back(row);
			}
		}
		return out;
	}
};

/**
 * Aggregator: multi-key grouping with per-subject count/mean/std
 *
 * The grouping-key set is a parameter, so school, municipality and
 * department level tables (optionally crossed with grade or year) all go
 * through the same code.
 *
 * Invariants:
 * - A record missing any grouping key is excluded, never bucketed
 * - Only present scores contribute; count 0 produces no row
 * - mean is the arithmetic mean of exactly the contributing values
 * - std is the sample standard deviation (0 for a single value)
 */
class Aggregator {
public:
	/**
	 * @param records Canonical records
	 * @param group_keys Fields forming the group tuple (empty = one national group)
	 * @param subjects Subjects to aggregate, in output order
	 * @param options Aggregation floor
	 */
	static AggregationResult Aggregate(const core::RecordSet &records, const std::vector<std::string> &group_keys,
	                                   const std::vector<std::string> &subjects,
	                                   const core::AggregationOptions &options = core::AggregationOptions());

	/// Aggregate at a level, with extra dimensions (e.g. {"year"}) appended to its keys
	static AggregationResult AggregateLevel(const core::RecordSet &records, core::EntityLevel level,
	                                        const std::vector<std::string> &subjects,
	                                        const std::vector<std::string> &extra_dimensions = {},
	                                        const core::AggregationOptions &options = core::AggregationOptions()) {
		return Aggregate(records, core::LevelKeys(level, extra_dimensions), subjects, options);
	}
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline AggregationResult Aggregator::Aggregate(const core::RecordSet &records,
                                               const std::vector<std::string> &group_keys,
                                               const std::vector<std::string> &subjects,
                                               const core::AggregationOptions &options) {
	options.Validate();

	AggregationResult result;
	result.group_keys = group_keys;
	for (const auto &subject : subjects) {
		bool duplicate = false;
		for (const auto &s : result.subjects) {
			duplicate = duplicate || s == subject;
		}
		if (!duplicate) {
			result.subjects.push_back(subject);
		}
	}

	// group tuple -> one accumulator per subject (same order as result.subjects)
	std::map<std::vector<std::string>, std::vector<utils::RunningStats>> groups;
	std::vector<bool> subject_seen(result.subjects.size(), false);
	std::vector<std::string> key;

	for (const auto &record : records) {
		if (!core::ExtractKey(record, group_keys, key)) {
			result.excluded_missing_key++;
			continue;
		}
		auto it = groups.find(key);
		if (it == groups.end()) {
			it = groups.emplace(key, std::vector<utils::RunningStats>(result.subjects.size())).first;
		}
		for (size_t s = 0; s < result.subjects.size(); s++) {
			auto score = record.Score(result.subjects[s]);
			if (score) {
				it->second[s].Push(*score);
				subject_seen[s] = true;
			}
		}
	}

	std::map<std::vector<std::string>, std::vector<std::string>> withheld_by_group;

	for (const auto &group : groups) {
		for (size_t s = 0; s < result.subjects.size(); s++) {
			const auto &stats = group.second[s];
			if (stats.Count() == 0) {
				continue;
			}
			if (stats.Count() < options.min_count) {
				result.withheld.push_back(WithheldGroup {group.first, result.subjects[s], stats.Count()});
				withheld_by_group[group.first].push_back(result.subjects[s]);
				continue;
			}
			core::AggregateRow row;
			row.group_key = group.first;
			row.subject = result.subjects[s];
			row.count = stats.Count();
			row.mean = stats.Mean();
			row.std_dev = stats.StdDev();
			result.rows.push_back(std::move(row));
		}
	}

	if (result.excluded_missing_key > 0) {
		result.diagnostics.emplace_back(core::DiagnosticKind::MissingField, core::JoinKey(group_keys, ','),
		                                result.excluded_missing_key, "records excluded for missing grouping key");
	}
	for (size_t s = 0; s < result.subjects.size(); s++) {
		if (!subject_seen[s]) {
			result.diagnostics.emplace_back(core::DiagnosticKind::MissingField, result.subjects[s], 0,
			                                "subject has no values in any record");
		}
	}
	for (const auto &entry : withheld_by_group) {
		result.diagnostics.emplace_back(core::DiagnosticKind::InsufficientSample, core::JoinKey(entry.first),
		                                entry.second.size(),
		                                "group below minimum count of " + std::to_string(options.min_count) +
		                                    " for " + core::JoinKey(entry.second, ','));
	}

	return result;
}

} // namespace aggregation
} // namespace libsaberstat
